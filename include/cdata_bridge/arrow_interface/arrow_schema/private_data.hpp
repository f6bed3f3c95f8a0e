#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/arrow_interface/arrow_array_schema_common_release.hpp"
#include "cdata_bridge/arrow_interface/ownership_token.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * Private data of an exported `ArrowSchema`: owns the format, name and
     * metadata strings and the arena of child and dictionary schemas.
     */
    class CDATA_BRIDGE_API arrow_schema_private_data : public ownership_token
    {
    public:

        static constexpr token_tag token_kind = token_tag::arrow_schema;

        arrow_schema_private_data(
            std::string format,
            std::string name,
            std::optional<std::string> metadata,
            std::size_t n_children,
            bool has_dictionary
        );

        [[nodiscard]] const char* format_ptr() const noexcept;
        [[nodiscard]] const char* name_ptr() const noexcept;
        [[nodiscard]] const char* metadata_ptr() const noexcept;

        [[nodiscard]] children_arena<ArrowSchema>& children() noexcept;

    private:

        std::string m_format;
        std::string m_name;
        std::optional<std::string> m_metadata;
        children_arena<ArrowSchema> m_children;
    };
}

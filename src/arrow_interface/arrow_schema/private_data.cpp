#include "cdata_bridge/arrow_interface/arrow_schema/private_data.hpp"

#include <utility>

namespace cdata_bridge
{
    arrow_schema_private_data::arrow_schema_private_data(
        std::string format,
        std::string name,
        std::optional<std::string> metadata,
        std::size_t n_children,
        bool has_dictionary
    )
        : ownership_token(token_kind)
        , m_format(std::move(format))
        , m_name(std::move(name))
        , m_metadata(std::move(metadata))
        , m_children(n_children, has_dictionary)
    {
    }

    const char* arrow_schema_private_data::format_ptr() const noexcept
    {
        return m_format.c_str();
    }

    const char* arrow_schema_private_data::name_ptr() const noexcept
    {
        return m_name.c_str();
    }

    const char* arrow_schema_private_data::metadata_ptr() const noexcept
    {
        return m_metadata.has_value() ? m_metadata->data() : nullptr;
    }

    children_arena<ArrowSchema>& arrow_schema_private_data::children() noexcept
    {
        return m_children;
    }
}

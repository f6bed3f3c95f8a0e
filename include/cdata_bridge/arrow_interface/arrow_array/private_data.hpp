#pragma once

#include <cstddef>
#include <vector>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/arrow_interface/arrow_array_schema_common_release.hpp"
#include "cdata_bridge/arrow_interface/ownership_token.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * Private data of an exported `ArrowArray`.
     *
     * Holds one reference on the exported array, which keeps every buffer the C
     * structure points to alive, plus the arena of child and dictionary arrays.
     * Destroying it drops that reference only.
     */
    class CDATA_BRIDGE_API arrow_array_private_data : public ownership_token
    {
    public:

        static constexpr token_tag token_kind = token_tag::arrow_array;

        explicit arrow_array_private_data(array_ptr source);

        [[nodiscard]] const void** buffers_ptrs() noexcept;
        [[nodiscard]] std::size_t n_buffers() const noexcept;

        [[nodiscard]] const array_ptr& source() const noexcept;
        [[nodiscard]] children_arena<ArrowArray>& children() noexcept;

    private:

        array_ptr m_source;
        std::vector<const void*> m_buffer_pointers;
        children_arena<ArrowArray> m_children;
    };
}

#include "cdata_bridge/arrow_interface/arrow_array/private_data.hpp"

#include <utility>

namespace cdata_bridge
{
    arrow_array_private_data::arrow_array_private_data(array_ptr source)
        : ownership_token(token_kind)
        , m_source(std::move(source))
        , m_children(m_source->children().size(), m_source->dictionary() != nullptr)
    {
        m_buffer_pointers.reserve(m_source->buffers().size());
        for (const auto& buf : m_source->buffers())
        {
            m_buffer_pointers.push_back(buf.data());
        }
    }

    const void** arrow_array_private_data::buffers_ptrs() noexcept
    {
        return m_buffer_pointers.empty() ? nullptr : m_buffer_pointers.data();
    }

    std::size_t arrow_array_private_data::n_buffers() const noexcept
    {
        return m_buffer_pointers.size();
    }

    const array_ptr& arrow_array_private_data::source() const noexcept
    {
        return m_source;
    }

    children_arena<ArrowArray>& arrow_array_private_data::children() noexcept
    {
        return m_children;
    }
}

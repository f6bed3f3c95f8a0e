#include "cdata_bridge/buffer.hpp"

#include <utility>

namespace cdata_bridge
{
    buffer::buffer(const std::uint8_t* data, std::size_t size, std::shared_ptr<const void> owner)
        : m_data(data)
        , m_size(size)
        , m_owner(std::move(owner))
    {
    }

    buffer buffer::from_owned(sparrow::buffer<std::uint8_t>&& storage)
    {
        auto owner = std::make_shared<sparrow::buffer<std::uint8_t>>(std::move(storage));
        const std::uint8_t* data = owner->empty() ? nullptr : owner->data();
        const std::size_t size = owner->size();
        return buffer(data, size, std::move(owner));
    }

    buffer buffer::borrowed(const std::uint8_t* data, std::size_t size, std::shared_ptr<const void> keep_alive)
    {
        return buffer(data, size, std::move(keep_alive));
    }

    const std::uint8_t* buffer::data() const noexcept
    {
        return m_data;
    }

    std::size_t buffer::size() const noexcept
    {
        return m_size;
    }

    bool buffer::empty() const noexcept
    {
        return m_size == 0;
    }

    bool buffer::is_absent() const noexcept
    {
        return m_data == nullptr;
    }

    std::span<const std::uint8_t> buffer::span() const noexcept
    {
        if (m_data == nullptr)
        {
            return {};
        }
        return {m_data, m_size};
    }

    long buffer::use_count() const noexcept
    {
        return m_owner.use_count();
    }

    const std::shared_ptr<const void>& buffer::owner() const noexcept
    {
        return m_owner;
    }
}

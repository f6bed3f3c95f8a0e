#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <sparrow/buffer/buffer.hpp>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * @brief Immutable view over a byte region together with a reference on its owner.
     *
     * Copying a buffer never copies bytes: copies share the owner, whose reference
     * count is atomic. The region stays valid as long as one copy is alive.
     * A default constructed buffer is absent (null data, zero size), which is how
     * an omitted validity bitmap is represented.
     */
    class CDATA_BRIDGE_API buffer
    {
    public:

        buffer() = default;

        /**
         * @brief Takes ownership of bytes allocated by sparrow.
         */
        [[nodiscard]] static buffer from_owned(sparrow::buffer<std::uint8_t>&& storage);

        /**
         * @brief Wraps memory owned elsewhere.
         *
         * @param data Start of the region.
         * @param size Size of the region in bytes.
         * @param keep_alive Owner of the region. The region must stay valid until the
         *                   last reference on @p keep_alive is dropped.
         */
        [[nodiscard]] static buffer
        borrowed(const std::uint8_t* data, std::size_t size, std::shared_ptr<const void> keep_alive);

        [[nodiscard]] const std::uint8_t* data() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] bool empty() const noexcept;
        [[nodiscard]] bool is_absent() const noexcept;
        [[nodiscard]] std::span<const std::uint8_t> span() const noexcept;

        template <class T>
        [[nodiscard]] const T* data_as() const noexcept
        {
            return reinterpret_cast<const T*>(m_data);
        }

        // Number of live references on the owner, 0 for an absent buffer.
        [[nodiscard]] long use_count() const noexcept;

        [[nodiscard]] const std::shared_ptr<const void>& owner() const noexcept;

    private:

        buffer(const std::uint8_t* data, std::size_t size, std::shared_ptr<const void> owner);

        const std::uint8_t* m_data = nullptr;
        std::size_t m_size = 0;
        std::shared_ptr<const void> m_owner;
    };
}

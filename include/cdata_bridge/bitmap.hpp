#pragma once

#include <cstdint>
#include <vector>

#include <sparrow/buffer/buffer.hpp>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge::bitmap
{
    [[nodiscard]] constexpr std::int64_t bytes_for_bits(std::int64_t bits) noexcept
    {
        return (bits + 7) / 8;
    }

    // Bits are numbered least significant first within each byte.
    [[nodiscard]] inline bool get_bit(const std::uint8_t* bits, std::int64_t i) noexcept
    {
        return ((bits[i >> 3] >> (i & 7)) & 1) != 0;
    }

    /**
     * @brief Counts the unset bits in [offset, offset + length) of a validity bitmap.
     *
     * @param bits The bitmap, or nullptr when every value is valid.
     * @param offset Index of the first bit to consider.
     * @param length Number of bits to consider.
     * @return The number of null values, 0 if @p bits is null.
     */
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t
    count_nulls(const std::uint8_t* bits, std::int64_t offset, std::int64_t length);

    /**
     * @brief Packs a vector of validity flags into a bitmap allocated by sparrow.
     *
     * Padding bits of the last byte are left unset.
     */
    [[nodiscard]] CDATA_BRIDGE_API sparrow::buffer<std::uint8_t> pack(const std::vector<bool>& validity);
}

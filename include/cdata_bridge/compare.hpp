#pragma once

#include <cstdint>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * @brief Logical equality of two arrays.
     *
     * Two arrays are equal when they have the same type, the same length, nulls at
     * the same positions and equal values elsewhere. Physical layout is ignored:
     * offsets, absent versus all-set validity bitmaps, dictionary contents that
     * are not referenced and bytes behind null slots do not matter.
     */
    [[nodiscard]] CDATA_BRIDGE_API bool array_equals(const array_data& lhs, const array_data& rhs);

    // Compares element i of lhs with element j of rhs. Both arrays must have equal types.
    [[nodiscard]] CDATA_BRIDGE_API bool
    element_equals(const array_data& lhs, std::int64_t i, const array_data& rhs, std::int64_t j);
}

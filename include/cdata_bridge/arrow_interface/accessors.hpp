#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    [[nodiscard]] CDATA_BRIDGE_API bool is_released(const ArrowArray& array) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API bool is_released(const ArrowSchema& schema) noexcept;

    // Marks the structure released without invoking its release callback.
    CDATA_BRIDGE_API void mark_released(ArrowArray& array) noexcept;
    CDATA_BRIDGE_API void mark_released(ArrowSchema& schema) noexcept;

    /**
     * @brief Moves a C structure out of @p source, leaving it released.
     *
     * The release responsibility is transferred to the returned structure.
     *
     * @throws bridge_error with error_kind::use_after_release (arrays) or
     *         error_kind::released_schema (schemas) if @p source is null or released.
     */
    [[nodiscard]] CDATA_BRIDGE_API ArrowArray move_arrow_array(ArrowArray* source);
    [[nodiscard]] CDATA_BRIDGE_API ArrowSchema move_arrow_schema(ArrowSchema* source);

    // Checked accessors. Each throws bridge_error with error_kind::use_after_release
    // on a released array.
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t get_length(const ArrowArray& array);
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t get_null_count(const ArrowArray& array);
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t get_offset(const ArrowArray& array);

    // Throws error_kind::structural_mismatch when i is out of range.
    [[nodiscard]] CDATA_BRIDGE_API const void* get_buffer(const ArrowArray& array, std::size_t i);
    [[nodiscard]] CDATA_BRIDGE_API const ArrowArray& get_child(const ArrowArray& array, std::size_t i);

    // Null when the array is not dictionary encoded.
    [[nodiscard]] CDATA_BRIDGE_API const ArrowArray* get_dictionary(const ArrowArray& array);

    // Checked accessors. Each throws bridge_error with error_kind::released_schema
    // on a released schema.
    [[nodiscard]] CDATA_BRIDGE_API std::string_view get_format(const ArrowSchema& schema);
    [[nodiscard]] CDATA_BRIDGE_API std::string_view get_name(const ArrowSchema& schema);
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t get_flags(const ArrowSchema& schema);
    [[nodiscard]] CDATA_BRIDGE_API const ArrowSchema& get_schema_child(const ArrowSchema& schema, std::size_t i);
}

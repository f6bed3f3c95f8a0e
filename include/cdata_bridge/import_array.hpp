#pragma once

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"
#include "cdata_bridge/import_options.hpp"

namespace cdata_bridge
{
    /**
     * @brief Imports an `ArrowArray` tree received from a foreign producer.
     *
     * The whole tree is validated against @p type first: lengths, offsets, null
     * counts, buffer, child and dictionary counts, required buffers, offsets and
     * union/dictionary indices bounds, buffer alignment and nesting depth. Nothing
     * is released and @p array is left untouched when validation fails.
     *
     * On success @p array is moved into an imported_array_handle and marked
     * released: the caller must not release it. Buffers are wrapped without copy
     * (misaligned buffers excepted, see import_options) and keep the handle alive;
     * the foreign release callback is invoked exactly once, when the last buffer
     * of the returned tree is dropped.
     *
     * @param array The array to import.
     * @param type The type decoded from the paired schema.
     * @throws bridge_error with error_kind::use_after_release,
     *         error_kind::structural_mismatch or error_kind::alignment_or_bounds_violation.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr
    import_array(ArrowArray* array, const data_type& type, const import_options& options = {});
}

#pragma once

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * @brief Exports an array as an `ArrowArray` tree without copying any buffer.
     *
     * The layout of the whole tree is checked against the array types before the
     * first C structure is written. Each node holds one reference on its source
     * array until it is released.
     *
     * @param source The array to export.
     * @param out Destination. Its previous content is overwritten without being released.
     * @throws bridge_error with error_kind::structural_mismatch when the buffers,
     *         children or dictionary of a node disagree with its type.
     */
    CDATA_BRIDGE_API void export_array(const array_ptr& source, ArrowArray* out);

    [[nodiscard]] CDATA_BRIDGE_API ArrowArray export_array(const array_ptr& source);
}

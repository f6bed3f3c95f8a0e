#pragma once

#include <memory>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/arrow_interface/arrow_array/private_data.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * Release callback of every `ArrowArray` exported by this library.
     *
     * Releases the children and the dictionary that were not moved out, drops the
     * reference on the exported array and marks the array released. Calling it on
     * a null or already released array, or on an array whose private data is not
     * an arrow_array_private_data, does nothing.
     */
    CDATA_BRIDGE_API void release_arrow_array(ArrowArray* array);

    /**
     * Fills @p array with the length, null count, offset and buffers of the array
     * held by @p private_data and installs release_arrow_array. Ownership of
     * @p private_data is transferred to the array.
     */
    CDATA_BRIDGE_API void fill_arrow_array(ArrowArray& array, std::unique_ptr<arrow_array_private_data> private_data);
}

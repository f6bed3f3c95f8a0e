#pragma once

#include <cstddef>

namespace cdata_bridge
{
    /**
     * @brief Run time settings of the schema and array importers.
     */
    struct import_options
    {
        // Deepest nesting accepted in a received schema or array tree.
        std::size_t max_recursion_depth = 64;

        // When true, fixed-width, offsets and union buffers whose address is not a
        // multiple of their element alignment are copied into aligned storage.
        // When false, such buffers are rejected with
        // error_kind::alignment_or_bounds_violation.
        bool copy_misaligned_buffers = true;
    };
}

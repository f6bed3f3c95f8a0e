#pragma once

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"
#include "cdata_bridge/import_options.hpp"

namespace cdata_bridge
{
    /**
     * @brief Decodes an `ArrowSchema` tree into a field without taking ownership of it.
     *
     * The schema is only read: its release callback is never invoked.
     *
     * @throws bridge_error with
     *         - error_kind::released_schema if the node or one of its descendants is released,
     *         - error_kind::invalid_schema for null format or child pointers, a negative
     *           child count, inconsistent flags, a non-integer dictionary index, bad
     *           metadata or a tree deeper than import_options::max_recursion_depth,
     *         - the errors of decode_format.
     */
    [[nodiscard]] CDATA_BRIDGE_API field decode_schema(const ArrowSchema& schema, const import_options& options = {});

    /**
     * @brief Decodes an `ArrowSchema` tree and releases it.
     *
     * The schema is released on success only: when an exception is thrown, the
     * caller still owns it.
     */
    [[nodiscard]] CDATA_BRIDGE_API field import_schema(ArrowSchema* schema, const import_options& options = {});
}

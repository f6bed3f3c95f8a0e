#pragma once

#include <cstdint>
#include <memory>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/arrow_interface/arrow_schema/private_data.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * Release callback of every `ArrowSchema` exported by this library.
     *
     * Releases the children and the dictionary that were not moved out, frees the
     * private data and marks the schema released. Calling it on a null or already
     * released schema, or on a schema whose private data is not an
     * arrow_schema_private_data, does nothing.
     */
    CDATA_BRIDGE_API void release_arrow_schema(ArrowSchema* schema);

    /**
     * Fills @p schema from its private data and installs release_arrow_schema.
     * Ownership of @p private_data is transferred to the schema.
     */
    CDATA_BRIDGE_API void
    fill_arrow_schema(ArrowSchema& schema, std::int64_t flags, std::unique_ptr<arrow_schema_private_data> private_data);
}

#pragma once

#include <string_view>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    /**
     * @brief Exports a field as an `ArrowSchema` tree.
     *
     * Every format string is encoded and every check is done before the first C
     * structure is written: on failure @p out is left untouched and nothing leaks.
     * The produced tree owns all of its strings and children, and does not
     * reference the field once the call returns.
     *
     * @param f The field to export.
     * @param out Destination. Its previous content is overwritten without being released.
     * @throws bridge_error with error_kind::unsupported_type if any type in the
     *         tree has no format token.
     */
    CDATA_BRIDGE_API void export_field(const field& f, ArrowSchema* out);

    [[nodiscard]] CDATA_BRIDGE_API ArrowSchema
    export_schema(const data_type& type, std::string_view name = "", bool nullable = true);
}

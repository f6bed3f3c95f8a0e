#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    /**
     * @brief Encodes a logical type as a C Data Interface format string.
     *
     * Parametrised types carry their parameters in the token ("w:16",
     * "d:19,4", "tsu:UTC", "+w:3", "+ud:0,5"). A dictionary type is encoded as its
     * index type: the value type is described by the dictionary schema.
     *
     * @throws bridge_error with error_kind::unsupported_type when the type has no
     *         token (time32 with a sub-millisecond unit, negative width, union codes
     *         that do not match the children, non-integer dictionary index...).
     */
    [[nodiscard]] CDATA_BRIDGE_API std::string encode_format(const data_type& type);

    /**
     * @brief Decodes a format string together with the already decoded children.
     *
     * Left inverse of encode_format for every non-dictionary type. Dictionary types
     * are assembled by the schema importer from the index token and the dictionary
     * schema.
     *
     * @param format The format string.
     * @param children Decoded child fields, in declaration order.
     * @param flags Schema flags. Only ARROW_FLAG_MAP_KEYS_SORTED is read, for maps.
     * @throws bridge_error with error_kind::malformed_format_string for unknown
     *         tokens or bad parameters, error_kind::child_arity_mismatch when the
     *         number or shape of the children disagrees with the token.
     */
    [[nodiscard]] CDATA_BRIDGE_API data_type
    decode_format(std::string_view format, std::vector<field> children, std::int64_t flags = 0);

    // Flags of the schema node that describes f.
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t encode_flags(const field& f);

    [[nodiscard]] CDATA_BRIDGE_API bool has_flag(std::int64_t flags, sparrow::ArrowFlag flag) noexcept;
}

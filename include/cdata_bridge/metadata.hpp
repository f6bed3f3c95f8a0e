#pragma once

#include <string>

#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    /**
     * @brief Serializes key/value pairs in the C Data Interface metadata layout,
     * through sparrow::get_metadata_from_key_values.
     *
     * The layout is an int32 pair count followed, for each pair, by the int32 key
     * length, the key bytes, the int32 value length and the value bytes. Integers
     * use the native byte order. The returned string may contain NUL bytes.
     */
    [[nodiscard]] CDATA_BRIDGE_API std::string encode_metadata(const metadata_type& metadata);

    /**
     * @brief Parses a metadata blob produced by encode_metadata or by a foreign producer.
     *
     * Sizes are checked before the blob is read through sparrow::key_value_view.
     *
     * @param blob Start of the blob. Must not be null.
     * @throws bridge_error with error_kind::invalid_schema on a negative count or length.
     */
    [[nodiscard]] CDATA_BRIDGE_API metadata_type decode_metadata(const char* blob);
}

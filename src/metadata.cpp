#include "cdata_bridge/metadata.hpp"

#include <cstdint>
#include <cstring>

#include <sparrow/utils/metadata.hpp>

#include "cdata_bridge/bridge_error.hpp"

namespace cdata_bridge
{
    namespace
    {
        std::int32_t read_size(const char*& cursor)
        {
            std::int32_t value = 0;
            std::memcpy(&value, cursor, sizeof(value));
            cursor += sizeof(value);
            if (value < 0)
            {
                throw bridge_error(error_kind::invalid_schema, "Negative metadata size " + std::to_string(value));
            }
            return value;
        }

        // key_value_view trusts the sizes it reads.
        void check_sizes(const char* blob)
        {
            const char* cursor = blob;
            const std::int32_t count = read_size(cursor);
            for (std::int32_t i = 0; i < 2 * count; ++i)
            {
                cursor += read_size(cursor);
            }
        }
    }

    std::string encode_metadata(const metadata_type& metadata)
    {
        return sparrow::get_metadata_from_key_values(metadata);
    }

    metadata_type decode_metadata(const char* blob)
    {
        check_sizes(blob);
        const auto view = sparrow::key_value_view(blob);
        metadata_type metadata;
        metadata.reserve(static_cast<std::size_t>(view.size()));
        for (const auto& [key, value] : view)
        {
            metadata.emplace_back(std::string(key), std::string(value));
        }
        return metadata;
    }
}

#include "cdata_bridge/bitmap.hpp"

#include <sparrow/buffer/dynamic_bitset/dynamic_bitset_view.hpp>

namespace cdata_bridge::bitmap
{
    std::int64_t count_nulls(const std::uint8_t* bits, std::int64_t offset, std::int64_t length)
    {
        if (bits == nullptr || length <= 0)
        {
            return 0;
        }
        const sparrow::dynamic_bitset_view<const std::uint8_t> whole{bits, static_cast<std::size_t>(offset + length)};
        std::int64_t null_count = static_cast<std::int64_t>(whole.null_count());
        if (offset > 0)
        {
            const sparrow::dynamic_bitset_view<const std::uint8_t> skipped{bits, static_cast<std::size_t>(offset)};
            null_count -= static_cast<std::int64_t>(skipped.null_count());
        }
        return null_count;
    }

    sparrow::buffer<std::uint8_t> pack(const std::vector<bool>& validity)
    {
        const auto n_bytes = static_cast<std::size_t>(bytes_for_bits(static_cast<std::int64_t>(validity.size())));
        sparrow::buffer<std::uint8_t> storage(n_bytes, std::uint8_t{0});
        if (n_bytes == 0)
        {
            return storage;
        }
        sparrow::dynamic_bitset_view<std::uint8_t> view{storage.data(), validity.size()};
        for (std::size_t i = 0; i < validity.size(); ++i)
        {
            view.set(i, validity[i]);
        }
        return storage;
    }
}

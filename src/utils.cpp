#include "cdata_bridge/utils.hpp"

#include <charconv>

namespace cdata_bridge::utils
{
    std::optional<std::string_view> parse_after_separator(std::string_view format_str, std::string_view sep)
    {
        const auto sep_pos = format_str.find(sep);
        if (sep_pos == std::string_view::npos)
        {
            return std::nullopt;
        }
        return format_str.substr(sep_pos + sep.length());
    }

    std::vector<std::string_view> extract_words_after_colon(std::string_view str)
    {
        std::vector<std::string_view> result;

        const auto remaining_opt = parse_after_separator(str, ":");
        if (!remaining_opt.has_value() || remaining_opt->empty())
        {
            return result;
        }
        const std::string_view remaining = *remaining_opt;

        size_t start = 0;
        size_t comma_pos = remaining.find(',');
        while (comma_pos != std::string_view::npos)
        {
            result.push_back(remaining.substr(start, comma_pos - start));
            start = comma_pos + 1;
            comma_pos = remaining.find(',', start);
        }
        result.push_back(remaining.substr(start));

        return result;
    }

    std::optional<std::int32_t> parse_to_int32(std::string_view str)
    {
        std::int32_t value = 0;
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

        if (str.empty() || ec != std::errc() || ptr != str.data() + str.size())
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<std::tuple<std::int32_t, std::int32_t, std::optional<std::int32_t>>>
    parse_decimal_format(std::string_view format_str)
    {
        const auto words = extract_words_after_colon(format_str);
        if (words.size() != 2 && words.size() != 3)
        {
            return std::nullopt;
        }

        const auto precision = parse_to_int32(words[0]);
        const auto scale = parse_to_int32(words[1]);
        if (!precision.has_value() || !scale.has_value())
        {
            return std::nullopt;
        }

        std::optional<std::int32_t> bit_width;
        if (words.size() == 3)
        {
            bit_width = parse_to_int32(words[2]);
            if (!bit_width.has_value())
            {
                return std::nullopt;
            }
        }
        return std::make_tuple(*precision, *scale, bit_width);
    }

    bool is_aligned(const void* ptr, std::size_t alignment) noexcept
    {
        return reinterpret_cast<std::uintptr_t>(ptr) % alignment == 0;
    }
}

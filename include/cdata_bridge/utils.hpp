#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge::utils
{
    // Returns the part of format_str that follows the first occurrence of sep.
    CDATA_BRIDGE_API std::optional<std::string_view>
    parse_after_separator(std::string_view format_str, std::string_view sep);

    /**
     * @brief Extracts words after ':' separated by ',' from a string.
     *
     * @param str Input string to parse (e.g., "prefix:word1,word2,word3")
     * @return Vector of string views containing the extracted words.
     *         Returns an empty vector if ':' is not found or if there are no words after it.
     *
     * @example
     * extract_words_after_colon("d:128,10") returns {"128", "10"}
     * extract_words_after_colon("+us:0,1") returns {"0", "1"}
     * extract_words_after_colon("no_colon") returns {}
     */
    CDATA_BRIDGE_API std::vector<std::string_view> extract_words_after_colon(std::string_view str);

    /**
     * @brief Parses a string_view to int32_t using std::from_chars.
     *
     * @return The parsed integer value, or std::nullopt if parsing fails or if
     *         characters remain after the number.
     *
     * @example
     * parse_to_int32("123") returns 123
     * parse_to_int32("12a") returns std::nullopt
     * parse_to_int32("") returns std::nullopt
     */
    CDATA_BRIDGE_API std::optional<std::int32_t> parse_to_int32(std::string_view str);

    /**
     * @brief Parses "d:precision,scale" or "d:precision,scale,bitWidth".
     *
     * @return (precision, scale, bit width if present), or std::nullopt when the
     *         string does not follow one of these forms.
     */
    CDATA_BRIDGE_API std::optional<std::tuple<std::int32_t, std::int32_t, std::optional<std::int32_t>>>
    parse_decimal_format(std::string_view format_str);

    // Whether ptr is a multiple of alignment. A null pointer is aligned.
    [[nodiscard]] CDATA_BRIDGE_API bool is_aligned(const void* ptr, std::size_t alignment) noexcept;
}

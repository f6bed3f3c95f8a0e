#include <cstdint>

#include <doctest/doctest.h>

#include "cdata_bridge/utils.hpp"

namespace cdata_bridge
{
    TEST_CASE("parse_after_separator")
    {
        SUBCASE("Separator found")
        {
            auto result = utils::parse_after_separator("tsu:UTC", ":");
            REQUIRE(result.has_value());
            CHECK_EQ(result.value(), "UTC");
        }

        SUBCASE("Separator at end")
        {
            auto result = utils::parse_after_separator("tsn:", ":");
            REQUIRE(result.has_value());
            CHECK(result->empty());
        }

        SUBCASE("No separator")
        {
            CHECK_FALSE(utils::parse_after_separator("tdD", ":").has_value());
        }
    }

    TEST_CASE("extract_words_after_colon")
    {
        SUBCASE("Decimal parameters")
        {
            auto result = utils::extract_words_after_colon("d:38,10,256");
            REQUIRE_EQ(result.size(), 3);
            CHECK_EQ(result[0], "38");
            CHECK_EQ(result[1], "10");
            CHECK_EQ(result[2], "256");
        }

        SUBCASE("Union type codes")
        {
            auto result = utils::extract_words_after_colon("+ud:4,7");
            REQUIRE_EQ(result.size(), 2);
            CHECK_EQ(result[0], "4");
            CHECK_EQ(result[1], "7");
        }

        SUBCASE("No colon in string")
        {
            CHECK(utils::extract_words_after_colon("+s").empty());
        }

        SUBCASE("Colon at end")
        {
            CHECK(utils::extract_words_after_colon("+us:").empty());
        }

        SUBCASE("Empty words are kept")
        {
            auto result = utils::extract_words_after_colon("d:,");
            REQUIRE_EQ(result.size(), 2);
            CHECK(result[0].empty());
            CHECK(result[1].empty());
        }
    }

    TEST_CASE("parse_to_int32")
    {
        SUBCASE("Valid values")
        {
            CHECK_EQ(utils::parse_to_int32("123"), 123);
            CHECK_EQ(utils::parse_to_int32("-456"), -456);
            CHECK_EQ(utils::parse_to_int32("0"), 0);
            CHECK_EQ(utils::parse_to_int32("2147483647"), 2147483647);
        }

        SUBCASE("Invalid values")
        {
            CHECK_FALSE(utils::parse_to_int32("").has_value());
            CHECK_FALSE(utils::parse_to_int32("abc").has_value());
            CHECK_FALSE(utils::parse_to_int32("12a").has_value());
            CHECK_FALSE(utils::parse_to_int32("-").has_value());
            CHECK_FALSE(utils::parse_to_int32("2147483648").has_value());
        }
    }

    TEST_CASE("parse_decimal_format")
    {
        SUBCASE("Precision and scale")
        {
            auto result = utils::parse_decimal_format("d:19,4");
            REQUIRE(result.has_value());
            CHECK_EQ(std::get<0>(*result), 19);
            CHECK_EQ(std::get<1>(*result), 4);
            CHECK_FALSE(std::get<2>(*result).has_value());
        }

        SUBCASE("With bit width")
        {
            auto result = utils::parse_decimal_format("d:40,2,256");
            REQUIRE(result.has_value());
            CHECK_EQ(std::get<2>(*result), 256);
        }

        SUBCASE("Negative scale")
        {
            auto result = utils::parse_decimal_format("d:5,-2");
            REQUIRE(result.has_value());
            CHECK_EQ(std::get<1>(*result), -2);
        }

        SUBCASE("Malformed")
        {
            CHECK_FALSE(utils::parse_decimal_format("d:19").has_value());
            CHECK_FALSE(utils::parse_decimal_format("d:19,4,128,1").has_value());
            CHECK_FALSE(utils::parse_decimal_format("d:x,4").has_value());
            CHECK_FALSE(utils::parse_decimal_format("d19,4").has_value());
        }
    }

    TEST_CASE("is_aligned")
    {
        alignas(8) std::uint8_t storage[16] = {};
        CHECK(utils::is_aligned(storage, 8));
        CHECK(utils::is_aligned(storage + 4, 4));
        CHECK_FALSE(utils::is_aligned(storage + 1, 2));
        CHECK_FALSE(utils::is_aligned(storage + 4, 8));
        CHECK(utils::is_aligned(storage + 3, 1));
        CHECK(utils::is_aligned(nullptr, 8));
    }
}

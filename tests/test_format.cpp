#include <string>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

#include <sparrow/types/data_type.hpp>

#include "cdata_bridge/format.hpp"
#include "cdata_bridge_tests_helpers.hpp"

namespace cdata_bridge
{
    TEST_SUITE("format")
    {
        TEST_CASE("encode_format primitive tokens")
        {
            CHECK_EQ(encode_format(data_type(type_id::na)), "n");
            CHECK_EQ(encode_format(data_type(type_id::boolean)), "b");
            CHECK_EQ(encode_format(data_type(type_id::int8)), "c");
            CHECK_EQ(encode_format(data_type(type_id::uint16)), "S");
            CHECK_EQ(encode_format(data_type(type_id::int32)), "i");
            CHECK_EQ(encode_format(data_type(type_id::uint64)), "L");
            CHECK_EQ(encode_format(data_type(type_id::float16)), "e");
            CHECK_EQ(encode_format(data_type(type_id::float64)), "g");
            CHECK_EQ(encode_format(data_type(type_id::utf8)), "u");
            CHECK_EQ(encode_format(data_type(type_id::large_binary)), "Z");
            CHECK_EQ(encode_format(data_type(type_id::date32)), "tdD");
            CHECK_EQ(encode_format(data_type(type_id::date64)), "tdm");
            CHECK_EQ(encode_format(data_type(type_id::interval_month_day_nano)), "tin");
        }

        TEST_CASE("encode_format parametrised tokens")
        {
            CHECK_EQ(encode_format(data_type::fixed_size_binary(16)), "w:16");
            CHECK_EQ(encode_format(data_type::decimal128(19, 4)), "d:19,4");
            CHECK_EQ(encode_format(data_type::decimal256(40, 2)), "d:40,2,256");
            CHECK_EQ(encode_format(data_type::time32(time_unit::milli)), "ttm");
            CHECK_EQ(encode_format(data_type::time64(time_unit::nano)), "ttn");
            CHECK_EQ(encode_format(data_type::timestamp(time_unit::micro, "UTC")), "tsu:UTC");
            CHECK_EQ(encode_format(data_type::timestamp(time_unit::second)), "tss:");
            CHECK_EQ(encode_format(data_type::duration(time_unit::nano)), "tDn");
        }

        TEST_CASE("encode_format nested tokens")
        {
            const field item("item", data_type(type_id::int32));
            CHECK_EQ(encode_format(data_type::list(item)), "+l");
            CHECK_EQ(encode_format(data_type::large_list(item)), "+L");
            CHECK_EQ(encode_format(data_type::fixed_size_list(item, 3)), "+w:3");
            CHECK_EQ(encode_format(data_type::struct_({item})), "+s");
            CHECK_EQ(encode_format(data_type::map(field("key", data_type(type_id::utf8), false), item)), "+m");
            CHECK_EQ(encode_format(data_type::sparse_union({item, field("s", data_type(type_id::utf8))})), "+us:0,1");
            CHECK_EQ(
                encode_format(data_type::dense_union({item, field("s", data_type(type_id::utf8))}, {0, 5})),
                "+ud:0,5"
            );
            CHECK_EQ(
                encode_format(data_type::dictionary(data_type(type_id::int16), data_type(type_id::utf8))),
                "s"
            );
        }

        TEST_CASE("encode_format unsupported types")
        {
            check_bridge_error([] { (void) encode_format(data_type::time32(time_unit::micro)); }, error_kind::unsupported_type);
            check_bridge_error([] { (void) encode_format(data_type::time64(time_unit::second)); }, error_kind::unsupported_type);
            check_bridge_error([] { (void) encode_format(data_type::fixed_size_binary(-1)); }, error_kind::unsupported_type);
            check_bridge_error([] { (void) encode_format(data_type::decimal128(39, 0)); }, error_kind::unsupported_type);
            check_bridge_error([] { (void) encode_format(data_type::decimal256(0, 0)); }, error_kind::unsupported_type);
            check_bridge_error(
                [] { (void) encode_format(data_type::dictionary(data_type(type_id::float32), data_type(type_id::utf8))); },
                error_kind::unsupported_type
            );
            check_bridge_error(
                []
                {
                    (void) encode_format(data_type::sparse_union(
                        {field("a", data_type(type_id::int32)), field("b", data_type(type_id::int32))},
                        {3, 3}
                    ));
                },
                error_kind::unsupported_type
            );
        }

        TEST_CASE("decode_format inverts encode_format")
        {
            const std::vector<data_type> types = {
                data_type(type_id::na),
                data_type(type_id::boolean),
                data_type(type_id::int64),
                data_type(type_id::float32),
                data_type(type_id::large_utf8),
                data_type(type_id::binary),
                data_type(type_id::interval_day_time),
                data_type::fixed_size_binary(0),
                data_type::decimal128(38, 10),
                data_type::decimal256(76, -3),
                data_type::time32(time_unit::second),
                data_type::time64(time_unit::micro),
                data_type::timestamp(time_unit::nano, "Europe/Paris"),
                data_type::timestamp(time_unit::milli),
                data_type::duration(time_unit::second)
            };
            for (const auto& type : types)
            {
                CAPTURE(to_string(type));
                CHECK(decode_format(encode_format(type), {}) == type);
            }
        }

        TEST_CASE("decode_format nested tokens")
        {
            const field item("item", data_type(type_id::int32));

            SUBCASE("list")
            {
                CHECK(decode_format("+l", {item}) == data_type::list(item));
                CHECK(decode_format("+L", {item}) == data_type::large_list(item));
            }

            SUBCASE("fixed size list")
            {
                const data_type type = decode_format("+w:4", {item});
                CHECK_EQ(type.id(), type_id::fixed_size_list);
                CHECK_EQ(type.list_size(), 4);
            }

            SUBCASE("struct with no children")
            {
                CHECK_EQ(decode_format("+s", {}).n_children(), 0);
            }

            SUBCASE("map reads the keys sorted flag")
            {
                const field key("key", data_type(type_id::utf8), false);
                const field entries("entries", data_type::struct_({key, item}), false);
                CHECK_FALSE(decode_format("+m", {entries}).keys_sorted());
                const data_type sorted = decode_format(
                    "+m",
                    {entries},
                    static_cast<std::int64_t>(sp::ArrowFlag::MAP_KEYS_SORTED)
                );
                CHECK(sorted.keys_sorted());
                CHECK(sorted == data_type::map(key, item, true));
            }

            SUBCASE("union type codes")
            {
                const data_type type = decode_format("+ud:2,9", {item, item});
                CHECK_EQ(type.id(), type_id::dense_union);
                CHECK_EQ(type.type_codes(), std::vector<std::int8_t>{2, 9});
            }
        }

        TEST_CASE("decode_format rejects malformed tokens")
        {
            for (const char* format : {"", "x", "ii", "w:", "w:abc", "w:-1", "d:19", "d:0,1", "d:39,0", "d:19,4,64",
                                       "tsu", "tsx:", "ttu:", "tD", "tix", "+w:", "+w:x", "+ux:0", "+us:0,0",
                                       "+us:128", "+q"})
            {
                CAPTURE(std::string(format));
                check_bridge_error([format] { (void) decode_format(format, {}); }, error_kind::malformed_format_string);
            }
        }

        TEST_CASE("leaf tokens agree with sparrow")
        {
            const std::vector<std::pair<data_type, sp::data_type>> cases = {
                {data_type(type_id::na), sp::data_type::NA},
                {data_type(type_id::boolean), sp::data_type::BOOL},
                {data_type(type_id::int8), sp::data_type::INT8},
                {data_type(type_id::uint32), sp::data_type::UINT32},
                {data_type(type_id::int64), sp::data_type::INT64},
                {data_type(type_id::float16), sp::data_type::HALF_FLOAT},
                {data_type(type_id::float32), sp::data_type::FLOAT},
                {data_type(type_id::utf8), sp::data_type::STRING},
                {data_type(type_id::large_utf8), sp::data_type::LARGE_STRING},
                {data_type(type_id::binary), sp::data_type::BINARY},
                {data_type(type_id::date32), sp::data_type::DATE_DAYS},
                {data_type(type_id::date64), sp::data_type::DATE_MILLISECONDS},
                {data_type::time32(time_unit::second), sp::data_type::TIME_SECONDS},
                {data_type::time64(time_unit::micro), sp::data_type::TIME_MICROSECONDS},
                {data_type::duration(time_unit::milli), sp::data_type::DURATION_MILLISECONDS},
                {data_type(type_id::interval_day_time), sp::data_type::INTERVAL_DAYS_TIME}
            };
            for (const auto& [type, kind] : cases)
            {
                CAPTURE(to_string(type));
                const std::string format = encode_format(type);
                CHECK_EQ(format, std::string(sp::data_type_to_format(kind)));
                CHECK_EQ(sp::format_to_data_type(format), kind);
                CHECK(decode_format(format, {}) == type);
            }
            CHECK_EQ(sp::format_to_data_type(encode_format(data_type::timestamp(time_unit::nano, "UTC"))), sp::data_type::TIMESTAMP_NANOSECONDS);
            CHECK_EQ(sp::format_to_data_type(encode_format(data_type::decimal256(40, 2))), sp::data_type::DECIMAL256);
            CHECK_EQ(sp::format_to_data_type(encode_format(data_type::fixed_size_binary(4))), sp::data_type::FIXED_WIDTH_BINARY);
        }

        TEST_CASE("sparrow kinds without an in-process type are rejected")
        {
            for (const char* format : {"vu", "vz", "+vl", "+r", "d:9,2,32", "d:18,2,64"})
            {
                CAPTURE(std::string(format));
                check_bridge_error([format] { (void) decode_format(format, {}); }, error_kind::malformed_format_string);
            }
        }

        TEST_CASE("decode_format rejects child arity mismatches")
        {
            const field item("item", data_type(type_id::int32));
            check_bridge_error([] { (void) decode_format("+l", {}); }, error_kind::child_arity_mismatch);
            check_bridge_error([&] { (void) decode_format("+L", {item, item}); }, error_kind::child_arity_mismatch);
            check_bridge_error([&] { (void) decode_format("+w:2", {}); }, error_kind::child_arity_mismatch);
            check_bridge_error([&] { (void) decode_format("+us:0,1", {item}); }, error_kind::child_arity_mismatch);
            check_bridge_error([&] { (void) decode_format("+m", {item}); }, error_kind::child_arity_mismatch);
            check_bridge_error([&] { (void) decode_format("i", {item}); }, error_kind::child_arity_mismatch);
        }

        TEST_CASE("encode_flags")
        {
            CHECK_EQ(encode_flags(field("a", data_type(type_id::int32), true)), static_cast<std::int64_t>(sp::ArrowFlag::NULLABLE));
            CHECK_EQ(encode_flags(field("a", data_type(type_id::int32), false)), 0);

            const data_type ordered = data_type::dictionary(data_type(type_id::int8), data_type(type_id::utf8), true);
            const std::int64_t dict_flags = encode_flags(field("d", ordered, false));
            CHECK(has_flag(dict_flags, sp::ArrowFlag::DICTIONARY_ORDERED));
            CHECK_FALSE(has_flag(dict_flags, sp::ArrowFlag::NULLABLE));

            const data_type sorted = data_type::map(
                field("key", data_type(type_id::utf8), false),
                field("value", data_type(type_id::int32)),
                true
            );
            CHECK(has_flag(encode_flags(field("m", sorted, true)), sp::ArrowFlag::MAP_KEYS_SORTED));
        }

        TEST_CASE("flag bits match the C data interface")
        {
            const data_type ordered = data_type::dictionary(data_type(type_id::int8), data_type(type_id::utf8), true);
            CHECK_EQ(encode_flags(field("d", ordered, false)), 1);
            CHECK_EQ(encode_flags(field("a", data_type(type_id::int32), true)), 2);
            const data_type sorted = data_type::map(
                field("key", data_type(type_id::utf8), false),
                field("value", data_type(type_id::int32)),
                true
            );
            CHECK_EQ(encode_flags(field("m", sorted, false)), 4);
            CHECK_EQ(encode_flags(field("m", sorted, true)), 6);
        }
    }
}

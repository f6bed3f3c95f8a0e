#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "cdata_bridge/array_builders.hpp"
#include "cdata_bridge/arrow_interface/accessors.hpp"
#include "cdata_bridge/bridge.hpp"
#include "cdata_bridge/compare.hpp"
#include "cdata_bridge_tests_helpers.hpp"

namespace cdata_bridge
{
    namespace
    {
        array_ptr round_trip(const array_ptr& source)
        {
            c_data_pair pair = export_to_c(source, "column");
            array_ptr res = try_from(&pair.schema(), &pair.array());
            CHECK(pair.is_released());
            return res;
        }

        using decimal_bytes = std::array<std::uint64_t, 2>;
    }

    TEST_SUITE("round trip")
    {
        TEST_CASE("int32 with a null")
        {
            const array_ptr source = make_primitive_array<std::int32_t>({1, std::nullopt, 3});
            const array_ptr result = round_trip(source);
            CHECK(array_equals(*source, *result));
            CHECK_EQ(result->null_count(), 1);
            REQUIRE_FALSE(result->buffer_at(0).is_absent());
            CHECK_EQ(result->buffer_at(0).data()[0] & 0x07, 0b101);
            CHECK(result->buffer_at(1).data() == source->buffer_at(1).data());
        }

        TEST_CASE("flat types")
        {
            const std::vector<array_ptr> arrays = {
                make_null_array(3),
                make_boolean_array({true, std::nullopt, false}),
                make_primitive_array<std::uint8_t>({255, 0}),
                make_primitive_array<float>({1.f, std::nullopt}),
                make_string_array({"a", std::nullopt, ""}),
                make_string_array({"large", "utf8"}, type_id::large_utf8),
                make_string_array({std::string("\0\1", 2)}, type_id::binary),
                make_fixed_size_binary_array(3, {"abc", std::nullopt}),
                make_fixed_width_array<decimal_bytes>(data_type::decimal128(20, 2), {decimal_bytes{1, 0}, std::nullopt}),
                make_fixed_width_array<std::int64_t>(data_type::timestamp(time_unit::nano, "UTC"), {0, 1'000'000'000}),
                make_fixed_width_array<std::int32_t>(data_type(type_id::date32), {19000, std::nullopt}),
                make_fixed_width_array<std::int32_t>(data_type::time32(time_unit::milli), {1}),
                make_fixed_width_array<std::int64_t>(data_type::duration(time_unit::second), {-5})
            };
            for (const auto& source : arrays)
            {
                CAPTURE(to_string(source->type()));
                CHECK(array_equals(*source, *round_trip(source)));
            }
        }

        TEST_CASE("list<int32>")
        {
            const array_ptr source = make_list_array(
                {0, 2, 2, 5},
                make_primitive_array<std::int32_t>({1, 2, std::nullopt, 4, 5}),
                std::vector<bool>{true, false, true}
            );
            const array_ptr result = round_trip(source);
            CHECK(array_equals(*source, *result));
            CHECK_EQ(result->list_range(2), std::pair<std::int64_t, std::int64_t>{2, 5});
        }

        TEST_CASE("struct{a: utf8, b: float64}")
        {
            const array_ptr source = make_struct_array(
                {"a", "b"},
                {make_string_array({"x", std::nullopt, "zz"}), make_primitive_array<double>({0.5, 1.5, std::nullopt})},
                std::vector<bool>{true, true, false}
            );
            const array_ptr result = round_trip(source);
            CHECK(array_equals(*source, *result));
            CHECK_EQ(result->type().child(0).name, "a");
            CHECK_EQ(result->child(0)->string_value(2), "zz");
        }

        TEST_CASE("dictionary of utf8")
        {
            const array_ptr source = make_dictionary_array(
                make_primitive_array<std::int32_t>({2, 0, std::nullopt, 2}),
                make_string_array({"low", "mid", "high"}),
                true
            );
            const array_ptr result = round_trip(source);
            CHECK(array_equals(*source, *result));
            REQUIRE(result->dictionary() != nullptr);
            CHECK(result->type().ordered());
            CHECK_EQ(result->dictionary()->string_value(result->dictionary_index(0)), "high");
        }

        TEST_CASE("other nested types")
        {
            const std::vector<array_ptr> arrays = {
                make_list_array({0, 1, 3}, make_string_array({"a", "b", "c"}), std::nullopt, true),
                make_fixed_size_list_array(2, make_primitive_array<std::int16_t>({1, 2, 3, std::nullopt})),
                make_map_array(
                    {0, 2, 2},
                    make_string_array({"k1", "k2"}),
                    make_primitive_array<std::int64_t>({10, std::nullopt}),
                    std::vector<bool>{true, false},
                    true
                ),
                make_sparse_union_array(
                    {"i", "s"},
                    {make_primitive_array<std::int32_t>({1, 0, 3}), make_string_array({"", "b", ""})},
                    {4, 1, 4},
                    {4, 1}
                ),
                make_dense_union_array(
                    {"i", "s"},
                    {make_primitive_array<std::int32_t>({1, 3}), make_string_array({"b"})},
                    {0, 1, 0},
                    {0, 0, 1}
                ),
                make_struct_array({}, {}, std::vector<bool>{true, false})
            };
            for (const auto& source : arrays)
            {
                CAPTURE(to_string(source->type()));
                CHECK(array_equals(*source, *round_trip(source)));
            }
        }

        TEST_CASE("slices")
        {
            const array_ptr source = make_string_array({"a", "bb", std::nullopt, "dddd"})->slice(1, 3);
            const array_ptr result = round_trip(source);
            CHECK_EQ(result->offset(), 1);
            CHECK(array_equals(*source, *result));
        }

        TEST_CASE("export of an imported array")
        {
            const array_ptr source = make_list_array({0, 2}, make_primitive_array<std::uint64_t>({1, 2}));
            const array_ptr once = round_trip(source);
            const array_ptr twice = round_trip(once);
            CHECK(array_equals(*source, *twice));
            CHECK(twice->child(0)->buffer_at(1).data() == source->child(0)->buffer_at(1).data());
        }

        TEST_CASE("field metadata and nullability")
        {
            const array_ptr source = make_primitive_array<std::int8_t>({1, 2});
            const field f("bytes", source->type(), false, metadata_type{{"encoding", "raw"}});
            c_data_pair pair = export_to_c(source, f);
            const imported_field imported = import_field_and_array(&pair.schema(), &pair.array());
            CHECK(imported.schema == f);
            CHECK(array_equals(*source, *imported.array));
        }

        TEST_CASE("failed import leaves both structures to the caller")
        {
            c_data_pair pair = export_to_c(make_primitive_array<std::int32_t>({1, 2}));
            pair.array().null_count = 7;
            check_bridge_error(
                [&] { (void) try_from(&pair.schema(), &pair.array()); },
                error_kind::structural_mismatch
            );
            CHECK_FALSE(is_released(pair.schema()));
            CHECK_FALSE(is_released(pair.array()));
            pair.array().null_count = 0;
        }
    }
}

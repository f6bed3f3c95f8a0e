#include <stdexcept>

#include <doctest/doctest.h>

#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    TEST_SUITE("data_type")
    {
        TEST_CASE("parameters")
        {
            const data_type fsb = data_type::fixed_size_binary(12);
            CHECK_EQ(fsb.id(), type_id::fixed_size_binary);
            CHECK_EQ(fsb.byte_width(), 12);

            const data_type decimal = data_type::decimal128(10, 3);
            CHECK_EQ(decimal.precision(), 10);
            CHECK_EQ(decimal.scale(), 3);

            const data_type ts = data_type::timestamp(time_unit::micro, "UTC");
            CHECK_EQ(ts.unit(), time_unit::micro);
            CHECK_EQ(ts.timezone(), "UTC");

            const data_type fsl = data_type::fixed_size_list(field("item", data_type(type_id::int8)), 5);
            CHECK_EQ(fsl.list_size(), 5);
            REQUIRE_EQ(fsl.n_children(), 1);
            CHECK_EQ(fsl.child(0).name, "item");
        }

        TEST_CASE("map entries")
        {
            const data_type type = data_type::map(
                field("key", data_type(type_id::utf8), false),
                field("value", data_type(type_id::int64))
            );
            REQUIRE_EQ(type.n_children(), 1);
            const field& entries = type.child(0);
            CHECK_EQ(entries.name, "entries");
            CHECK_FALSE(entries.nullable);
            REQUIRE_EQ(entries.type.id(), type_id::struct_);
            REQUIRE_EQ(entries.type.n_children(), 2);
            CHECK_EQ(entries.type.child(0).name, "key");
            CHECK_FALSE(entries.type.child(0).nullable);
            CHECK_EQ(entries.type.child(1).name, "value");
            CHECK_FALSE(type.keys_sorted());
        }

        TEST_CASE("union codes default to positions")
        {
            const data_type type = data_type::sparse_union(
                {field("a", data_type(type_id::int32)), field("b", data_type(type_id::utf8))}
            );
            CHECK_EQ(type.type_codes(), std::vector<std::int8_t>{0, 1});

            const data_type explicit_codes = data_type::dense_union({field("a", data_type(type_id::int32))}, {7});
            CHECK_EQ(explicit_codes.type_codes(), std::vector<std::int8_t>{7});
        }

        TEST_CASE("dictionary")
        {
            const data_type type = data_type::dictionary(data_type(type_id::int32), data_type(type_id::utf8), true);
            CHECK_EQ(type.index_type().id(), type_id::int32);
            CHECK_EQ(type.value_type().id(), type_id::utf8);
            CHECK(type.ordered());
            CHECK_EQ(layout_buffer_count(type), 2);
            CHECK_THROWS_AS((void) data_type(type_id::int32).index_type(), std::logic_error);
            CHECK_THROWS_AS((void) data_type(type_id::int32).value_type(), std::logic_error);
        }

        TEST_CASE("equality")
        {
            CHECK(data_type(type_id::int32) == data_type(type_id::int32));
            CHECK_FALSE(data_type(type_id::int32) == data_type(type_id::uint32));
            CHECK_FALSE(data_type::timestamp(time_unit::milli) == data_type::timestamp(time_unit::milli, "UTC"));
            CHECK_FALSE(data_type::decimal128(10, 2) == data_type::decimal128(10, 3));

            const field a("a", data_type(type_id::int32));
            const field b("b", data_type(type_id::int32));
            CHECK_FALSE(data_type::struct_({a}) == data_type::struct_({b}));
            CHECK_FALSE(field("a", data_type(type_id::int32), true) == field("a", data_type(type_id::int32), false));
            CHECK_FALSE(
                field("a", data_type(type_id::int32), true, metadata_type{{"k", "v"}})
                == field("a", data_type(type_id::int32), true)
            );
            CHECK_FALSE(
                data_type::dictionary(data_type(type_id::int8), data_type(type_id::utf8))
                == data_type::dictionary(data_type(type_id::int8), data_type(type_id::utf8), true)
            );
        }

        TEST_CASE("layout")
        {
            CHECK_EQ(layout_buffer_count(data_type(type_id::na)), 0);
            CHECK_EQ(layout_buffer_count(data_type(type_id::boolean)), 2);
            CHECK_EQ(layout_buffer_count(data_type(type_id::utf8)), 3);
            CHECK_EQ(layout_buffer_count(data_type::list(field("item", data_type(type_id::int32)))), 2);
            CHECK_EQ(layout_buffer_count(data_type::fixed_size_list(field("item", data_type(type_id::int32)), 2)), 1);
            CHECK_EQ(layout_buffer_count(data_type::struct_({})), 1);
            CHECK_EQ(layout_buffer_count(data_type::sparse_union({})), 1);
            CHECK_EQ(layout_buffer_count(data_type::dense_union({})), 2);

            CHECK_FALSE(has_validity_buffer(data_type(type_id::na)));
            CHECK_FALSE(has_validity_buffer(data_type::sparse_union({})));
            CHECK(has_validity_buffer(data_type(type_id::float64)));

            CHECK_EQ(fixed_width_bytes(data_type(type_id::int16)), 2);
            CHECK_EQ(fixed_width_bytes(data_type::decimal256(40, 0)), 32);
            CHECK_EQ(fixed_width_bytes(data_type(type_id::interval_month_day_nano)), 16);
            CHECK_EQ(fixed_width_bytes(data_type(type_id::boolean)), 0);
        }

        TEST_CASE("to_string")
        {
            CHECK_EQ(to_string(data_type(type_id::int32)), "int32");
            CHECK_EQ(
                to_string(data_type::list(field("item", data_type(type_id::int32)))),
                "list<item: int32>"
            );
        }
    }
}

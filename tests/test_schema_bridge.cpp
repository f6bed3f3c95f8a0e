#include <string>
#include <string_view>

#include <doctest/doctest.h>

#include "cdata_bridge/arrow_interface/accessors.hpp"
#include "cdata_bridge/export_schema.hpp"
#include "cdata_bridge/import_schema.hpp"
#include "cdata_bridge/metadata.hpp"
#include "cdata_bridge_tests_helpers.hpp"

namespace cdata_bridge
{
    TEST_SUITE("schema export")
    {
        TEST_CASE("primitive field")
        {
            ArrowSchema schema = export_schema(data_type(type_id::int32), "x", true);
            CHECK_EQ(std::string_view(schema.format), "i");
            CHECK_EQ(std::string_view(schema.name), "x");
            CHECK_EQ(schema.flags, static_cast<std::int64_t>(sp::ArrowFlag::NULLABLE));
            CHECK_EQ(schema.n_children, 0);
            CHECK(schema.children == nullptr);
            CHECK(schema.dictionary == nullptr);
            CHECK(schema.metadata == nullptr);
            REQUIRE(schema.release != nullptr);

            schema.release(&schema);
            CHECK(is_released(schema));
        }

        TEST_CASE("metadata is encoded")
        {
            const metadata_type metadata = {{"origin", "sensor"}, {"unit", "ms"}};
            ArrowSchema schema{};
            export_field(field("t", data_type(type_id::int64), false, metadata), &schema);
            REQUIRE(schema.metadata != nullptr);
            const metadata_type decoded = decode_metadata(schema.metadata);
            REQUIRE_EQ(decoded.size(), 2);
            CHECK_EQ(decoded[1].first, "unit");
            CHECK_EQ(decoded[1].second, "ms");
            CHECK_EQ(schema.flags, 0);
            schema.release(&schema);
        }

        TEST_CASE("struct children")
        {
            const data_type type = data_type::struct_({
                field("a", data_type(type_id::utf8)),
                field("b", data_type(type_id::float64), false)
            });
            ArrowSchema schema = export_schema(type, "rec");
            CHECK_EQ(std::string_view(schema.format), "+s");
            REQUIRE_EQ(schema.n_children, 2);
            const ArrowSchema& a = get_schema_child(schema, 0);
            const ArrowSchema& b = get_schema_child(schema, 1);
            CHECK_EQ(get_name(a), "a");
            CHECK_EQ(get_format(a), "u");
            CHECK_EQ(get_name(b), "b");
            CHECK_EQ(get_format(b), "g");
            CHECK_EQ(get_flags(b), 0);
            check_bridge_error([&] { (void) get_schema_child(schema, 2); }, error_kind::structural_mismatch);
            schema.release(&schema);
        }

        TEST_CASE("dictionary")
        {
            const data_type type = data_type::dictionary(data_type(type_id::int8), data_type(type_id::utf8), true);
            ArrowSchema schema = export_schema(type, "d", false);
            CHECK_EQ(std::string_view(schema.format), "c");
            CHECK_EQ(schema.n_children, 0);
            CHECK(has_flag(schema.flags, sp::ArrowFlag::DICTIONARY_ORDERED));
            REQUIRE(schema.dictionary != nullptr);
            CHECK_EQ(std::string_view(schema.dictionary->format), "u");
            CHECK(schema.dictionary->release != nullptr);
            schema.release(&schema);
        }

        TEST_CASE("unsupported type leaves the destination untouched")
        {
            const data_type type = data_type::struct_({
                field("ok", data_type(type_id::int32)),
                field("bad", data_type::time32(time_unit::nano))
            });
            ArrowSchema schema = create_test_arrow_schema("i", "sentinel");
            check_bridge_error([&] { export_field(field("s", type), &schema); }, error_kind::unsupported_type);
            CHECK_EQ(std::string_view(schema.format), "i");
            CHECK_EQ(std::string_view(schema.name), "sentinel");
            CHECK(schema.release == &release_test_schema);
        }

        TEST_CASE("exported tree does not reference the source field")
        {
            ArrowSchema schema{};
            {
                std::string name = "temporary";
                export_field(field(name, data_type::list(field("item", data_type(type_id::uint8)))), &schema);
                name.assign("overwritten");
            }
            CHECK_EQ(get_name(schema), "temporary");
            CHECK_EQ(get_name(get_schema_child(schema, 0)), "item");
            schema.release(&schema);
        }
    }

    TEST_SUITE("schema import")
    {
        TEST_CASE("decode_schema inverts export")
        {
            const std::vector<field> fields = {
                field("i", data_type(type_id::int32)),
                field("ts", data_type::timestamp(time_unit::micro, "UTC"), false, metadata_type{{"k", "v"}}),
                field("l", data_type::large_list(field("item", data_type(type_id::utf8), false))),
                field(
                    "m",
                    data_type::map(
                        field("key", data_type(type_id::utf8), false),
                        field("value", data_type::decimal128(12, 2)),
                        true
                    )
                ),
                field(
                    "u",
                    data_type::dense_union(
                        {field("a", data_type(type_id::int8)), field("b", data_type(type_id::binary))},
                        {3, 1}
                    )
                ),
                field("d", data_type::dictionary(data_type(type_id::uint16), data_type(type_id::large_utf8), true)),
                field("fsl", data_type::fixed_size_list(field("item", data_type(type_id::float32)), 4))
            };
            for (const auto& f : fields)
            {
                CAPTURE(f.name);
                ArrowSchema schema{};
                export_field(f, &schema);
                CHECK(decode_schema(schema) == f);
                CHECK_FALSE(is_released(schema));
                schema.release(&schema);
            }
        }

        TEST_CASE("import_schema releases on success only")
        {
            ArrowSchema schema = export_schema(data_type(type_id::boolean), "flag");
            const field f = import_schema(&schema);
            CHECK_EQ(f.name, "flag");
            CHECK(is_released(schema));

            ArrowSchema bad = create_test_arrow_schema("?");
            check_bridge_error([&] { (void) import_schema(&bad); }, error_kind::malformed_format_string);
            CHECK_FALSE(is_released(bad));
        }

        TEST_CASE("released schemas")
        {
            ArrowSchema schema = create_test_arrow_schema("i");
            schema.release = nullptr;
            check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::released_schema);
            check_bridge_error([&] { (void) get_format(schema); }, error_kind::released_schema);

            ArrowSchema child = create_test_arrow_schema("i", "item");
            child.release = nullptr;
            ArrowSchema* children[] = {&child};
            ArrowSchema parent = create_test_arrow_schema("+l", "list");
            parent.n_children = 1;
            parent.children = children;
            check_bridge_error([&] { (void) decode_schema(parent); }, error_kind::released_schema);

            check_bridge_error([] { (void) import_schema(nullptr); }, error_kind::released_schema);
        }

        TEST_CASE("invalid schemas")
        {
            SUBCASE("Null format")
            {
                ArrowSchema schema = create_test_arrow_schema("i");
                schema.format = nullptr;
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Negative child count")
            {
                ArrowSchema schema = create_test_arrow_schema("+s");
                schema.n_children = -1;
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Null children pointer")
            {
                ArrowSchema schema = create_test_arrow_schema("+s");
                schema.n_children = 1;
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Null child")
            {
                ArrowSchema* children[] = {nullptr};
                ArrowSchema schema = create_test_arrow_schema("+s");
                schema.n_children = 1;
                schema.children = children;
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Ordered flag without dictionary")
            {
                ArrowSchema schema = create_test_arrow_schema("i");
                schema.flags |= static_cast<std::int64_t>(sp::ArrowFlag::DICTIONARY_ORDERED);
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Keys sorted flag on a non-map")
            {
                ArrowSchema schema = create_test_arrow_schema("u");
                schema.flags |= static_cast<std::int64_t>(sp::ArrowFlag::MAP_KEYS_SORTED);
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Non-integer dictionary index")
            {
                ArrowSchema values = create_test_arrow_schema("u", "");
                ArrowSchema schema = create_test_arrow_schema("f");
                schema.dictionary = &values;
                check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::invalid_schema);
            }

            SUBCASE("Nesting deeper than the limit")
            {
                const data_type type = data_type::list(
                    field("l1", data_type::list(field("l2", data_type::list(field("item", data_type(type_id::int32))))))
                );
                ArrowSchema schema = export_schema(type);
                import_options options;
                options.max_recursion_depth = 2;
                check_bridge_error([&] { (void) decode_schema(schema, options); }, error_kind::invalid_schema);
                options.max_recursion_depth = 3;
                CHECK_EQ(decode_schema(schema, options).type, type);
                schema.release(&schema);
            }
        }

        TEST_CASE("format errors propagate")
        {
            ArrowSchema schema = create_test_arrow_schema("+l");
            check_bridge_error([&] { (void) decode_schema(schema); }, error_kind::child_arity_mismatch);

            ArrowSchema unknown = create_test_arrow_schema("vu");
            check_bridge_error([&] { (void) decode_schema(unknown); }, error_kind::malformed_format_string);
        }
    }
}

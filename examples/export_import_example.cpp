#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <sparrow/arrow_interface/arrow_array_schema_proxy.hpp>
#include <sparrow/primitive_array.hpp>

#include <cdata_bridge/array_builders.hpp>
#include <cdata_bridge/bridge.hpp>
#include <cdata_bridge/bridge_error.hpp>
#include <cdata_bridge/compare.hpp>

namespace sp = sparrow;

namespace
{
    cdata_bridge::array_ptr create_measurements()
    {
        auto sensors = cdata_bridge::make_dictionary_array(
            cdata_bridge::make_primitive_array<std::int8_t>({0, 1, 0, std::nullopt}),
            cdata_bridge::make_string_array({"north", "south"})
        );
        auto readings = cdata_bridge::make_list_array(
            {0, 2, 3, 3, 5},
            cdata_bridge::make_primitive_array<double>({1.5, 2.0, std::nullopt, 4.25, 8.0})
        );
        return cdata_bridge::make_struct_array({"sensor", "readings"}, {sensors, readings});
    }

    // Plays the role of a consumer living in another library: it only sees the C structures.
    void consume_with_sparrow(ArrowArray&& array, ArrowSchema&& schema)
    {
        sp::arrow_proxy proxy{std::move(array), std::move(schema)};
        std::cout << "   Consumer received '" << proxy.name().value_or("unnamed") << "' with " << proxy.length()
                  << " rows and " << proxy.n_children() << " children\n";
    }
}

int main()
{
    try
    {
        std::cout << "1. Building a struct<sensor: dictionary<utf8>, readings: list<double>> array...\n";
        const cdata_bridge::array_ptr measurements = create_measurements();
        std::cout << "   Type: " << cdata_bridge::to_string(measurements->type()) << "\n";

        std::cout << "\n2. Exporting through the C Data Interface...\n";
        cdata_bridge::c_data_pair exported = cdata_bridge::export_to_c(measurements, "measurements");
        std::cout << "   Exported " << exported.array().length << " rows, format '" << exported.schema().format
                  << "'\n";

        std::cout << "\n3. Importing the structures back...\n";
        const cdata_bridge::array_ptr imported = exported.to_array();
        if (!cdata_bridge::array_equals(*measurements, *imported))
        {
            std::cerr << "   ✗ Imported array differs from the exported one!\n";
            return EXIT_FAILURE;
        }
        std::cout << "   ✓ Imported array is equal to the exported one\n";

        std::cout << "\n4. Handing an export over to sparrow...\n";
        cdata_bridge::c_data_pair for_sparrow = cdata_bridge::export_to_c(imported, "measurements");
        auto [array, schema] = for_sparrow.extract();
        consume_with_sparrow(std::move(array), std::move(schema));

        std::cout << "\n5. Importing an array exported by sparrow...\n";
        auto [sp_array, sp_schema] = sp::extract_arrow_structures(sp::primitive_array<int32_t>({7, 8, 9}));
        const cdata_bridge::imported_field from_sparrow = cdata_bridge::import_field_and_array(&sp_schema, &sp_array);
        std::cout << "   Imported " << cdata_bridge::to_string(from_sparrow.schema.type) << " with "
                  << from_sparrow.array->length() << " values, last is "
                  << from_sparrow.array->value<std::int32_t>(from_sparrow.array->length() - 1) << "\n";
    }
    catch (const cdata_bridge::bridge_error& e)
    {
        std::cerr << "Bridge error (" << cdata_bridge::to_string(e.kind()) << "): " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

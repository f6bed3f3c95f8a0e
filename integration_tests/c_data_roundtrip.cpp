#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "integration_tools.hpp"

/**
 * @brief Checks that the record batches of an Arrow integration JSON file survive
 * a round trip through cdata_bridge over the C Data Interface.
 *
 * Every column is exported by sparrow, imported and re-exported by cdata_bridge,
 * imported back by sparrow and compared with the source column.
 *
 * Usage: c_data_roundtrip <json_file_path>
 *
 * @return EXIT_SUCCESS if every batch matches, EXIT_FAILURE on error or mismatch
 */
int main(int argc, char* argv[])
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <json_file_path>\n";
        std::cerr << "Round trips a JSON file through the C Data Interface and checks the data is unchanged.\n";
        return EXIT_FAILURE;
    }

    const std::filesystem::path json_path(argv[1]);

    try
    {
        std::cout << "Loading JSON file: " << json_path << "\n";

        const bool matches = integration_tools::validate_json_round_trip(json_path);
        if (matches)
        {
            std::cout << "\n✓ Round trip successful: data is identical after crossing the C Data Interface.\n";
            return EXIT_SUCCESS;
        }
        else
        {
            std::cerr << "\n✗ Round trip failed: data differs after crossing the C Data Interface.\n";
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}

#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include <sparrow/array.hpp>
#include <sparrow/record_batch.hpp>

namespace integration_tools
{
    /**
     * @brief Loads a JSON file in the Arrow integration format.
     *
     * @throws std::runtime_error if the file cannot be found, opened or parsed.
     */
    nlohmann::json load_json_file(const std::filesystem::path& json_path);

    /**
     * @brief Builds every record batch described by an Arrow integration JSON document.
     *
     * @throws std::runtime_error if the document has no 'batches' array or a batch
     *         cannot be built.
     */
    std::vector<sparrow::record_batch> json_to_record_batches(const nlohmann::json& json_data);

    /**
     * @brief Pushes a sparrow array through cdata_bridge and back.
     *
     * The array is exported by sparrow through the C Data Interface, imported by
     * cdata_bridge, exported again by cdata_bridge and finally imported by sparrow.
     *
     * @throws cdata_bridge::bridge_error if cdata_bridge rejects the array.
     */
    sparrow::array round_trip_array(const sparrow::array& source);

    /**
     * @brief Applies round_trip_array to every column of a record batch.
     */
    sparrow::record_batch round_trip_record_batch(const sparrow::record_batch& source);

    /**
     * @brief Checks that every batch of a JSON file survives the cdata_bridge round trip.
     *
     * @param json_path Path to the JSON file
     * @param verbose If true, prints detailed error messages to stderr
     * @return true if every round tripped batch is identical to its source
     * @throws std::runtime_error on parsing errors
     */
    bool validate_json_round_trip(const std::filesystem::path& json_path, bool verbose = true);

    /**
     * @brief Compares two record batches for equality.
     *
     * @param rb1 First record batch
     * @param rb2 Second record batch
     * @param batch_idx Index of the batch (for error reporting)
     * @param verbose If true, prints detailed error messages to stderr
     * @return true if the batches are identical, false otherwise
     */
    bool compare_record_batch(
        const sparrow::record_batch& rb1,
        const sparrow::record_batch& rb2,
        size_t batch_idx,
        bool verbose = true
    );
}

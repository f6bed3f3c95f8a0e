#include "integration_tools.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#if defined(__cpp_lib_format)
#    include <format>
#endif

#include <sparrow/json_reader/json_parser.hpp>

#include <cdata_bridge/bridge.hpp>

namespace integration_tools
{
    nlohmann::json load_json_file(const std::filesystem::path& json_path)
    {
        if (!std::filesystem::exists(json_path))
        {
            throw std::runtime_error("JSON file not found: " + json_path.string());
        }

        std::ifstream json_file(json_path);
        if (!json_file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + json_path.string());
        }

        try
        {
            return nlohmann::json::parse(json_file);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw std::runtime_error("Failed to parse JSON file: " + std::string(e.what()));
        }
    }

    std::vector<sparrow::record_batch> json_to_record_batches(const nlohmann::json& json_data)
    {
        if (!json_data.contains("batches") || !json_data["batches"].is_array())
        {
            throw std::runtime_error("JSON file does not contain a 'batches' array");
        }

        const size_t num_batches = json_data["batches"].size();
        std::vector<sparrow::record_batch> record_batches;
        record_batches.reserve(num_batches);

        for (size_t batch_idx = 0; batch_idx < num_batches; ++batch_idx)
        {
            try
            {
                record_batches.emplace_back(sparrow::json_reader::build_record_batch_from_json(json_data, batch_idx));
            }
            catch (const std::exception& e)
            {
                throw std::runtime_error(
                    "Failed to build record batch " + std::to_string(batch_idx) + ": " + e.what()
                );
            }
        }
        return record_batches;
    }

    sparrow::array round_trip_array(const sparrow::array& source)
    {
        sparrow::array copy = source;
        auto [sparrow_array, sparrow_schema] = sparrow::extract_arrow_structures(std::move(copy));

        // Owns the structures exported by sparrow until cdata_bridge takes them.
        cdata_bridge::c_data_pair received(std::move(sparrow_schema), std::move(sparrow_array));
        cdata_bridge::imported_field imported = cdata_bridge::import_field_and_array(
            &received.schema(),
            &received.array()
        );

        cdata_bridge::c_data_pair exported = cdata_bridge::export_to_c(imported.array, imported.schema);
        auto [bridge_array, bridge_schema] = exported.extract();
        return sparrow::array(std::move(bridge_array), std::move(bridge_schema));
    }

    sparrow::record_batch round_trip_record_batch(const sparrow::record_batch& source)
    {
        std::vector<std::string> names;
        std::vector<sparrow::array> columns;
        names.reserve(source.nb_columns());
        columns.reserve(source.nb_columns());
        for (const auto& name : source.names())
        {
            names.emplace_back(name);
        }
        for (size_t col_idx = 0; col_idx < source.nb_columns(); ++col_idx)
        {
            columns.push_back(round_trip_array(source.get_column(col_idx)));
        }
        return sparrow::record_batch(std::move(names), std::move(columns));
    }

    bool compare_record_batch(
        const sparrow::record_batch& rb1,
        const sparrow::record_batch& rb2,
        size_t batch_idx,
        bool verbose
    )
    {
        bool all_match = true;

        if (rb1.nb_columns() != rb2.nb_columns())
        {
            if (verbose)
            {
                std::cerr << "Error: Batch " << batch_idx << " has different number of columns: "
                          << rb1.nb_columns() << " vs " << rb2.nb_columns() << "\n";
            }
            return false;
        }

        if (rb1.nb_rows() != rb2.nb_rows())
        {
            if (verbose)
            {
                std::cerr << "Error: Batch " << batch_idx << " has different number of rows: " << rb1.nb_rows()
                          << " vs " << rb2.nb_rows() << "\n";
            }
            return false;
        }

        for (size_t col_idx = 0; col_idx < rb1.nb_columns(); ++col_idx)
        {
            const auto& col1 = rb1.get_column(col_idx);
            const auto& col2 = rb2.get_column(col_idx);

            if (col1.data_type() != col2.data_type())
            {
                if (verbose)
                {
                    std::cerr << "Error: Batch " << batch_idx << ", column " << col_idx
                              << " has different data type\n";
                }
                all_match = false;
                continue;
            }

            const auto col_name1 = col1.name();
            const auto col_name2 = col2.name();
            if (col_name1 != col_name2)
            {
                if (verbose)
                {
                    std::cerr << "Error: Batch " << batch_idx << ", column " << col_idx
                              << " has different name: '" << col_name1.value_or("unnamed") << "' vs '"
                              << col_name2.value_or("unnamed") << "'\n";
                }
                all_match = false;
            }

            if (col1.size() != col2.size())
            {
                if (verbose)
                {
                    std::cerr << "Error: Batch " << batch_idx << ", column " << col_idx
                              << " has different size: " << col1.size() << " vs " << col2.size() << "\n";
                }
                all_match = false;
                continue;
            }

            for (size_t row_idx = 0; row_idx < col1.size(); ++row_idx)
            {
                if (col1[row_idx] != col2[row_idx])
                {
                    if (verbose)
                    {
                        std::cerr << "Error: Batch " << batch_idx << ", column " << col_idx << " ('"
                                  << col_name1.value_or("unnamed") << "'), row " << row_idx
                                  << " has different value\n";
#if defined(__cpp_lib_format)
                        std::cerr << "  Source value:     " << std::format("{}", col1[row_idx]) << "\n";
                        std::cerr << "  Round trip value: " << std::format("{}", col2[row_idx]) << "\n";
#endif
                    }
                    all_match = false;
                }
            }
        }

        return all_match;
    }

    bool validate_json_round_trip(const std::filesystem::path& json_path, bool verbose)
    {
        const nlohmann::json json_data = load_json_file(json_path);
        const std::vector<sparrow::record_batch> batches = json_to_record_batches(json_data);

        bool all_match = true;
        for (size_t batch_idx = 0; batch_idx < batches.size(); ++batch_idx)
        {
            const sparrow::record_batch round_tripped = round_trip_record_batch(batches[batch_idx]);
            if (!compare_record_batch(batches[batch_idx], round_tripped, batch_idx, verbose))
            {
                all_match = false;
            }
        }
        return all_match;
    }
}

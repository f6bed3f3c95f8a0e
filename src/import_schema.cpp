#include "cdata_bridge/import_schema.hpp"

#include <string>
#include <vector>

#include "cdata_bridge/arrow_interface/accessors.hpp"
#include "cdata_bridge/bridge_error.hpp"
#include "cdata_bridge/format.hpp"
#include "cdata_bridge/metadata.hpp"

namespace cdata_bridge
{
    namespace
    {
        [[noreturn]] void throw_invalid(const std::string& name, const std::string& reason)
        {
            throw bridge_error(error_kind::invalid_schema, "field '" + name + "': " + reason);
        }

        field decode_node(const ArrowSchema& schema, std::size_t depth, const import_options& options)
        {
            if (is_released(schema))
            {
                throw bridge_error(error_kind::released_schema, "ArrowSchema has already been released");
            }
            std::string name = schema.name == nullptr ? std::string{} : std::string{schema.name};
            if (depth > options.max_recursion_depth)
            {
                throw_invalid(name, "nesting exceeds " + std::to_string(options.max_recursion_depth) + " levels");
            }
            if (schema.format == nullptr)
            {
                throw_invalid(name, "null format string");
            }
            if (schema.n_children < 0)
            {
                throw_invalid(name, "negative child count");
            }
            if (schema.n_children > 0 && schema.children == nullptr)
            {
                throw_invalid(name, "null children pointer");
            }

            std::vector<field> children;
            children.reserve(static_cast<std::size_t>(schema.n_children));
            for (std::int64_t i = 0; i < schema.n_children; ++i)
            {
                if (schema.children[i] == nullptr)
                {
                    throw_invalid(name, "null child " + std::to_string(i));
                }
                children.push_back(decode_node(*schema.children[i], depth + 1, options));
            }

            std::optional<metadata_type> metadata;
            if (schema.metadata != nullptr)
            {
                metadata = decode_metadata(schema.metadata);
            }

            const std::int64_t flags = schema.flags;
            const bool nullable = has_flag(flags, sparrow::ArrowFlag::NULLABLE);
            const bool ordered = has_flag(flags, sparrow::ArrowFlag::DICTIONARY_ORDERED);

            data_type type;
            if (schema.dictionary != nullptr)
            {
                data_type index_type = decode_format(schema.format, std::move(children));
                if (!is_integer(index_type.id()))
                {
                    throw_invalid(name, "dictionary index type " + to_string(index_type) + " is not an integer");
                }
                field values = decode_node(*schema.dictionary, depth + 1, options);
                type = data_type::dictionary(std::move(index_type), std::move(values.type), ordered);
            }
            else
            {
                if (ordered)
                {
                    throw_invalid(name, "dictionary ordered flag set without a dictionary");
                }
                type = decode_format(schema.format, std::move(children), flags);
            }

            if (has_flag(flags, sparrow::ArrowFlag::MAP_KEYS_SORTED) && type.id() != type_id::map)
            {
                throw_invalid(name, "map keys sorted flag set on " + to_string(type));
            }
            return field(std::move(name), std::move(type), nullable, std::move(metadata));
        }
    }

    field decode_schema(const ArrowSchema& schema, const import_options& options)
    {
        return decode_node(schema, 0, options);
    }

    field import_schema(ArrowSchema* schema, const import_options& options)
    {
        if (schema == nullptr)
        {
            throw bridge_error(error_kind::released_schema, "null ArrowSchema");
        }
        field res = decode_schema(*schema, options);
        schema->release(schema);
        mark_released(*schema);
        return res;
    }
}

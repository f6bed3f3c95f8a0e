#include "cdata_bridge/export_schema.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sparrow/utils/contracts.hpp>

#include "cdata_bridge/arrow_interface/arrow_schema.hpp"
#include "cdata_bridge/format.hpp"
#include "cdata_bridge/metadata.hpp"

namespace cdata_bridge
{
    namespace
    {
        // Fully encoded description of one schema node, built before any C structure.
        struct schema_node
        {
            std::string format;
            std::string name;
            std::optional<std::string> metadata;
            std::int64_t flags = 0;
            std::vector<schema_node> children;
            std::unique_ptr<schema_node> dictionary;
        };

        schema_node build_node(const field& f)
        {
            schema_node node;
            node.format = encode_format(f.type);
            node.name = f.name;
            node.flags = encode_flags(f);
            if (f.metadata.has_value())
            {
                node.metadata = encode_metadata(*f.metadata);
            }

            if (f.type.id() == type_id::dictionary)
            {
                node.dictionary = std::make_unique<schema_node>(build_node(field("", f.type.value_type(), true)));
                return node;
            }

            node.children.reserve(f.type.n_children());
            for (const auto& child : f.type.children())
            {
                node.children.push_back(build_node(child));
            }
            return node;
        }

        void finish_node(schema_node&& node, ArrowSchema& out)
        {
            auto private_data = std::make_unique<arrow_schema_private_data>(
                std::move(node.format),
                std::move(node.name),
                std::move(node.metadata),
                node.children.size(),
                node.dictionary != nullptr
            );
            auto& arena = private_data->children();
            for (std::size_t i = 0; i < node.children.size(); ++i)
            {
                finish_node(std::move(node.children[i]), arena.child(i));
            }
            if (node.dictionary != nullptr)
            {
                SPARROW_ASSERT_TRUE(arena.dictionary() != nullptr);
                finish_node(std::move(*node.dictionary), *arena.dictionary());
            }
            fill_arrow_schema(out, node.flags, std::move(private_data));
        }
    }

    void export_field(const field& f, ArrowSchema* out)
    {
        SPARROW_ASSERT_TRUE(out != nullptr);
        schema_node root = build_node(f);
        ArrowSchema schema{};
        finish_node(std::move(root), schema);
        *out = schema;
    }

    ArrowSchema export_schema(const data_type& type, std::string_view name, bool nullable)
    {
        ArrowSchema schema{};
        export_field(field(std::string(name), type, nullable), &schema);
        return schema;
    }
}

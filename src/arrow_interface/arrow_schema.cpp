#include "cdata_bridge/arrow_interface/arrow_schema.hpp"

#include <sparrow/utils/contracts.hpp>

namespace cdata_bridge
{
    void release_arrow_schema(ArrowSchema* schema)
    {
        if (schema == nullptr || schema->release == nullptr)
        {
            return;
        }
        auto* private_data = as_private_data<arrow_schema_private_data>(schema->private_data);
        if (private_data == nullptr || !private_data->try_release())
        {
            return;
        }
        // The children arena releases the children and the dictionary still alive.
        delete private_data;
        *schema = {};
    }

    void
    fill_arrow_schema(ArrowSchema& schema, std::int64_t flags, std::unique_ptr<arrow_schema_private_data> private_data)
    {
        SPARROW_ASSERT_TRUE(private_data != nullptr);

        auto& children = private_data->children();
        schema.format = private_data->format_ptr();
        schema.name = private_data->name_ptr();
        schema.metadata = private_data->metadata_ptr();
        schema.flags = flags;
        schema.n_children = static_cast<std::int64_t>(children.size());
        schema.children = children.children_ptrs();
        schema.dictionary = children.dictionary();
        schema.private_data = to_private_data(private_data.release());
        schema.release = &release_arrow_schema;
    }
}

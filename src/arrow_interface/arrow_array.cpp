#include "cdata_bridge/arrow_interface/arrow_array.hpp"

#include <sparrow/utils/contracts.hpp>

namespace cdata_bridge
{
    void release_arrow_array(ArrowArray* array)
    {
        if (array == nullptr || array->release == nullptr)
        {
            return;
        }
        auto* private_data = as_private_data<arrow_array_private_data>(array->private_data);
        if (private_data == nullptr || !private_data->try_release())
        {
            return;
        }
        // The buffers, children and dictionary are freed with the private data.
        delete private_data;
        *array = {};
    }

    void fill_arrow_array(ArrowArray& array, std::unique_ptr<arrow_array_private_data> private_data)
    {
        SPARROW_ASSERT_TRUE(private_data != nullptr);

        const array_data& source = *private_data->source();
        SPARROW_ASSERT_TRUE(source.length() >= 0);
        SPARROW_ASSERT_TRUE(source.null_count() >= 0);
        SPARROW_ASSERT_TRUE(source.offset() >= 0);

        auto& children = private_data->children();
        array.length = source.length();
        array.null_count = source.null_count();
        array.offset = source.offset();
        array.n_buffers = static_cast<std::int64_t>(private_data->n_buffers());
        array.buffers = private_data->buffers_ptrs();
        array.n_children = static_cast<std::int64_t>(children.size());
        array.children = children.children_ptrs();
        array.dictionary = children.dictionary();
        array.private_data = to_private_data(private_data.release());
        array.release = &release_arrow_array;
    }
}

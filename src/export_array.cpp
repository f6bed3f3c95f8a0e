#include "cdata_bridge/export_array.hpp"

#include <memory>
#include <string>

#include <sparrow/utils/contracts.hpp>

#include "cdata_bridge/arrow_interface/arrow_array.hpp"
#include "cdata_bridge/bridge_error.hpp"

namespace cdata_bridge
{
    namespace
    {
        [[noreturn]] void throw_mismatch(const array_data& array, const std::string& reason)
        {
            throw bridge_error(error_kind::structural_mismatch, to_string(array.type()) + " array " + reason);
        }

        bool requires_data(const data_type& type, std::size_t buffer_index)
        {
            if (buffer_index == 0 && has_validity_buffer(type))
            {
                return false;
            }
            if (type.id() == type_id::fixed_size_binary && type.byte_width() == 0)
            {
                return false;
            }
            // The data buffer of a binary array may be null when every value is empty.
            return !(is_binary_like(type.id()) && buffer_index == 2);
        }

        void check_layout(const array_ptr& array)
        {
            if (array == nullptr)
            {
                throw bridge_error(error_kind::structural_mismatch, "cannot export a null array");
            }
            const data_type& type = array->type();
            const bool is_dictionary = type.id() == type_id::dictionary;
            const data_type& physical = is_dictionary ? type.index_type() : type;

            const std::size_t expected_buffers = layout_buffer_count(physical);
            if (array->buffers().size() != expected_buffers)
            {
                throw_mismatch(
                    *array,
                    "has " + std::to_string(array->buffers().size()) + " buffers, expected "
                        + std::to_string(expected_buffers)
                );
            }
            if (array->length() > 0)
            {
                for (std::size_t i = 0; i < expected_buffers; ++i)
                {
                    if (requires_data(physical, i) && array->buffers()[i].is_absent())
                    {
                        throw_mismatch(*array, "is missing buffer " + std::to_string(i));
                    }
                }
            }
            if (array->null_count() > 0 && has_validity_buffer(physical) && array->buffers()[0].is_absent())
            {
                throw_mismatch(*array, "has nulls but no validity bitmap");
            }
            if (array->children().size() != type.n_children())
            {
                throw_mismatch(
                    *array,
                    "has " + std::to_string(array->children().size()) + " children, expected "
                        + std::to_string(type.n_children())
                );
            }
            for (std::size_t i = 0; i < type.n_children(); ++i)
            {
                check_layout(array->child(i));
                if (!(array->child(i)->type() == type.child(i).type))
                {
                    throw_mismatch(*array, "child " + std::to_string(i) + " is " + to_string(array->child(i)->type()));
                }
            }
            if (is_dictionary != (array->dictionary() != nullptr))
            {
                throw_mismatch(*array, is_dictionary ? "has no dictionary" : "has an unexpected dictionary");
            }
            if (is_dictionary)
            {
                check_layout(array->dictionary());
                if (!(array->dictionary()->type() == type.value_type()))
                {
                    throw_mismatch(*array, "has a dictionary of type " + to_string(array->dictionary()->type()));
                }
            }
        }

        void finish_node(const array_ptr& array, ArrowArray& out)
        {
            auto private_data = std::make_unique<arrow_array_private_data>(array);
            auto& arena = private_data->children();
            for (std::size_t i = 0; i < arena.size(); ++i)
            {
                finish_node(array->child(i), arena.child(i));
            }
            if (array->dictionary() != nullptr)
            {
                SPARROW_ASSERT_TRUE(arena.dictionary() != nullptr);
                finish_node(array->dictionary(), *arena.dictionary());
            }
            fill_arrow_array(out, std::move(private_data));
        }
    }

    void export_array(const array_ptr& source, ArrowArray* out)
    {
        SPARROW_ASSERT_TRUE(out != nullptr);
        check_layout(source);
        ArrowArray array{};
        finish_node(source, array);
        *out = array;
    }

    ArrowArray export_array(const array_ptr& source)
    {
        ArrowArray array{};
        export_array(source, &array);
        return array;
    }
}

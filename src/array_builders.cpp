#include "cdata_bridge/array_builders.hpp"

#include <algorithm>
#include <stdexcept>

namespace cdata_bridge
{
    namespace detail
    {
        buffer validity_buffer(const std::vector<bool>& validity)
        {
            if (std::all_of(validity.begin(), validity.end(), [](bool v) { return v; }))
            {
                return {};
            }
            return buffer::from_owned(bitmap::pack(validity));
        }
    }

    namespace
    {
        buffer optional_validity_buffer(const std::optional<std::vector<bool>>& validity)
        {
            return validity.has_value() ? detail::validity_buffer(*validity) : buffer{};
        }

        template <class O>
        buffer offsets_buffer(const std::vector<std::int64_t>& offsets)
        {
            std::vector<O> converted(offsets.begin(), offsets.end());
            return detail::buffer_from_values(converted);
        }

        std::int64_t list_length(const std::vector<std::int64_t>& offsets)
        {
            if (offsets.empty())
            {
                throw std::invalid_argument("A list array needs at least one offset");
            }
            return static_cast<std::int64_t>(offsets.size()) - 1;
        }

        void check_validity_length(const std::optional<std::vector<bool>>& validity, std::int64_t length)
        {
            if (validity.has_value() && static_cast<std::int64_t>(validity->size()) != length)
            {
                throw std::invalid_argument("Validity flags count does not match the array length");
            }
        }

        std::vector<field> make_fields(const std::vector<std::string>& names, const std::vector<array_ptr>& children)
        {
            if (names.size() != children.size())
            {
                throw std::invalid_argument("One name per child is required");
            }
            std::vector<field> fields;
            fields.reserve(children.size());
            for (std::size_t i = 0; i < children.size(); ++i)
            {
                fields.emplace_back(names[i], children[i]->type(), true);
            }
            return fields;
        }

        buffer single_zero_offset(bool large)
        {
            return large ? detail::buffer_from_values(std::vector<std::int64_t>{0})
                         : detail::buffer_from_values(std::vector<std::int32_t>{0});
        }
    }

    array_ptr make_null_array(std::int64_t length)
    {
        return std::make_shared<const array_data>(data_type(type_id::na), length, length, 0, std::vector<buffer>{});
    }

    array_ptr make_boolean_array(const std::vector<std::optional<bool>>& values)
    {
        std::vector<bool> bits;
        std::vector<bool> validity;
        bits.reserve(values.size());
        validity.reserve(values.size());
        for (const auto& v : values)
        {
            bits.push_back(v.value_or(false));
            validity.push_back(v.has_value());
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::validity_buffer(validity));
        buffers.push_back(buffer::from_owned(bitmap::pack(bits)));
        return std::make_shared<const array_data>(
            data_type(type_id::boolean),
            static_cast<std::int64_t>(values.size()),
            -1,
            0,
            std::move(buffers)
        );
    }

    array_ptr make_string_array(const std::vector<std::optional<std::string>>& values, type_id id)
    {
        if (!is_binary_like(id))
        {
            throw std::invalid_argument("make_string_array() cannot build " + std::string(to_string(id)));
        }
        std::vector<std::int64_t> offsets{0};
        std::vector<bool> validity;
        std::string data;
        offsets.reserve(values.size() + 1);
        validity.reserve(values.size());
        for (const auto& v : values)
        {
            if (v.has_value())
            {
                data += *v;
            }
            offsets.push_back(static_cast<std::int64_t>(data.size()));
            validity.push_back(v.has_value());
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::validity_buffer(validity));
        buffers.push_back(
            is_large_binary_like(id) ? offsets_buffer<std::int64_t>(offsets) : offsets_buffer<std::int32_t>(offsets)
        );
        buffers.push_back(detail::buffer_from_values(std::vector<char>(data.begin(), data.end())));
        return std::make_shared<const array_data>(
            data_type(id),
            static_cast<std::int64_t>(values.size()),
            -1,
            0,
            std::move(buffers)
        );
    }

    array_ptr make_fixed_size_binary_array(std::int32_t byte_width, const std::vector<std::optional<std::string>>& values)
    {
        std::vector<char> data(values.size() * static_cast<std::size_t>(byte_width), '\0');
        std::vector<bool> validity;
        validity.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            if (values[i].has_value())
            {
                if (values[i]->size() != static_cast<std::size_t>(byte_width))
                {
                    throw std::invalid_argument("Fixed size binary value does not match the byte width");
                }
                std::copy(values[i]->begin(), values[i]->end(), data.begin() + static_cast<std::ptrdiff_t>(i * byte_width));
            }
            validity.push_back(values[i].has_value());
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::validity_buffer(validity));
        buffers.push_back(detail::buffer_from_values(data));
        return std::make_shared<const array_data>(
            data_type::fixed_size_binary(byte_width),
            static_cast<std::int64_t>(values.size()),
            -1,
            0,
            std::move(buffers)
        );
    }

    array_ptr make_list_array(
        const std::vector<std::int64_t>& offsets,
        array_ptr values,
        std::optional<std::vector<bool>> validity,
        bool large
    )
    {
        const std::int64_t length = list_length(offsets);
        check_validity_length(validity, length);
        field value_field("item", values->type(), true);
        std::vector<buffer> buffers;
        buffers.push_back(optional_validity_buffer(validity));
        buffers.push_back(large ? offsets_buffer<std::int64_t>(offsets) : offsets_buffer<std::int32_t>(offsets));
        return std::make_shared<const array_data>(
            large ? data_type::large_list(std::move(value_field)) : data_type::list(std::move(value_field)),
            length,
            -1,
            0,
            std::move(buffers),
            std::vector<array_ptr>{std::move(values)}
        );
    }

    array_ptr
    make_fixed_size_list_array(std::int32_t list_size, array_ptr values, std::optional<std::vector<bool>> validity)
    {
        if (list_size <= 0)
        {
            throw std::invalid_argument("Fixed size list size must be positive");
        }
        const std::int64_t length = values->length() / list_size;
        check_validity_length(validity, length);
        std::vector<buffer> buffers;
        buffers.push_back(optional_validity_buffer(validity));
        return std::make_shared<const array_data>(
            data_type::fixed_size_list(field("item", values->type(), true), list_size),
            length,
            -1,
            0,
            std::move(buffers),
            std::vector<array_ptr>{std::move(values)}
        );
    }

    array_ptr make_map_array(
        const std::vector<std::int64_t>& offsets,
        array_ptr keys,
        array_ptr items,
        std::optional<std::vector<bool>> validity,
        bool keys_sorted
    )
    {
        const std::int64_t length = list_length(offsets);
        check_validity_length(validity, length);
        data_type type = data_type::map(field("key", keys->type(), false), field("value", items->type(), true), keys_sorted);
        const std::int64_t n_entries = keys->length();
        auto entries = std::make_shared<const array_data>(
            type.child(0).type,
            n_entries,
            0,
            0,
            std::vector<buffer>{buffer{}},
            std::vector<array_ptr>{std::move(keys), std::move(items)}
        );
        std::vector<buffer> buffers;
        buffers.push_back(optional_validity_buffer(validity));
        buffers.push_back(offsets_buffer<std::int32_t>(offsets));
        return std::make_shared<const array_data>(
            std::move(type),
            length,
            -1,
            0,
            std::move(buffers),
            std::vector<array_ptr>{std::move(entries)}
        );
    }

    array_ptr make_struct_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        std::optional<std::vector<bool>> validity
    )
    {
        std::int64_t length = 0;
        if (!children.empty())
        {
            length = children.front()->length();
        }
        else if (validity.has_value())
        {
            length = static_cast<std::int64_t>(validity->size());
        }
        for (const auto& child : children)
        {
            if (child->length() != length)
            {
                throw std::invalid_argument("Struct children must all have the same length");
            }
        }
        check_validity_length(validity, length);
        std::vector<buffer> buffers;
        buffers.push_back(optional_validity_buffer(validity));
        return std::make_shared<const array_data>(
            data_type::struct_(make_fields(names, children)),
            length,
            -1,
            0,
            std::move(buffers),
            std::move(children)
        );
    }

    array_ptr make_sparse_union_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        const std::vector<std::int8_t>& type_ids,
        std::vector<std::int8_t> type_codes
    )
    {
        const auto length = static_cast<std::int64_t>(type_ids.size());
        for (const auto& child : children)
        {
            if (child->length() < length)
            {
                throw std::invalid_argument("Sparse union children must be at least as long as the union");
            }
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::buffer_from_values(type_ids));
        return std::make_shared<const array_data>(
            data_type::sparse_union(make_fields(names, children), std::move(type_codes)),
            length,
            0,
            0,
            std::move(buffers),
            std::move(children)
        );
    }

    array_ptr make_dense_union_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        const std::vector<std::int8_t>& type_ids,
        const std::vector<std::int32_t>& value_offsets,
        std::vector<std::int8_t> type_codes
    )
    {
        if (type_ids.size() != value_offsets.size())
        {
            throw std::invalid_argument("Dense union needs one offset per type id");
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::buffer_from_values(type_ids));
        buffers.push_back(detail::buffer_from_values(value_offsets));
        return std::make_shared<const array_data>(
            data_type::dense_union(make_fields(names, children), std::move(type_codes)),
            static_cast<std::int64_t>(type_ids.size()),
            0,
            0,
            std::move(buffers),
            std::move(children)
        );
    }

    array_ptr make_dictionary_array(const array_ptr& indices, array_ptr dictionary, bool ordered)
    {
        if (!is_integer(indices->type().id()))
        {
            throw std::invalid_argument("Dictionary indices must be integers, got " + to_string(indices->type()));
        }
        return std::make_shared<const array_data>(
            data_type::dictionary(indices->type(), dictionary->type(), ordered),
            indices->length(),
            indices->null_count(),
            indices->offset(),
            indices->buffers(),
            std::vector<array_ptr>{},
            std::move(dictionary)
        );
    }

    array_ptr make_empty_array(const data_type& type)
    {
        std::vector<buffer> buffers;
        std::vector<array_ptr> children;
        array_ptr dictionary;
        const type_id id = type.id();
        switch (id)
        {
            case type_id::na:
                break;
            case type_id::utf8:
            case type_id::binary:
            case type_id::large_utf8:
            case type_id::large_binary:
                buffers.emplace_back();
                buffers.push_back(single_zero_offset(is_large_binary_like(id)));
                buffers.emplace_back();
                break;
            case type_id::list:
            case type_id::large_list:
            case type_id::map:
                buffers.emplace_back();
                buffers.push_back(single_zero_offset(id == type_id::large_list));
                break;
            case type_id::dictionary:
                buffers.resize(layout_buffer_count(type.index_type()));
                dictionary = make_empty_array(type.value_type());
                break;
            default:
                buffers.resize(layout_buffer_count(type));
                break;
        }
        children.reserve(type.n_children());
        for (const auto& child : type.children())
        {
            children.push_back(make_empty_array(child.type));
        }
        return std::make_shared<const array_data>(
            type,
            0,
            0,
            0,
            std::move(buffers),
            std::move(children),
            std::move(dictionary)
        );
    }
}

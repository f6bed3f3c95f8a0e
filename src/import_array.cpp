#include "cdata_bridge/import_array.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <sparrow/buffer/buffer.hpp>

#include "cdata_bridge/arrow_interface/accessors.hpp"
#include "cdata_bridge/arrow_interface/imported_array_handle.hpp"
#include "cdata_bridge/bitmap.hpp"
#include "cdata_bridge/bridge_error.hpp"
#include "cdata_bridge/utils.hpp"

namespace cdata_bridge
{
    namespace
    {
        [[noreturn]] void throw_mismatch(const data_type& type, const std::string& reason)
        {
            throw bridge_error(error_kind::structural_mismatch, to_string(type) + " array " + reason);
        }

        [[noreturn]] void throw_bounds(const data_type& type, const std::string& reason)
        {
            throw bridge_error(error_kind::alignment_or_bounds_violation, to_string(type) + " array " + reason);
        }

        // Reads element i of a buffer that may not be aligned for T.
        template <class T>
        T read_at(const void* buffer, std::int64_t i)
        {
            T value{};
            std::memcpy(&value, static_cast<const std::uint8_t*>(buffer) + i * static_cast<std::int64_t>(sizeof(T)), sizeof(T));
            return value;
        }

        const data_type& physical_type(const data_type& type)
        {
            return type.id() == type_id::dictionary ? type.index_type() : type;
        }

        bool is_validity_buffer(const data_type& physical, std::size_t i)
        {
            return i == 0 && has_validity_buffer(physical);
        }

        std::size_t offset_width(const data_type& physical)
        {
            return (is_large_binary_like(physical.id()) || physical.id() == type_id::large_list) ? sizeof(std::int64_t)
                                                                                                 : sizeof(std::int32_t);
        }

        bool is_offsets_buffer(const data_type& physical, std::size_t i)
        {
            return i == 1 && (is_binary_like(physical.id()) || is_list_like(physical.id()));
        }

        // Alignment required to read buffer i through its element type.
        std::size_t required_alignment(const data_type& physical, std::size_t i)
        {
            if (is_validity_buffer(physical, i))
            {
                return 1;
            }
            if (is_offsets_buffer(physical, i))
            {
                return offset_width(physical);
            }
            switch (physical.id())
            {
                case type_id::dense_union:
                    return i == 1 ? sizeof(std::int32_t) : 1;
                case type_id::boolean:
                case type_id::fixed_size_binary:
                case type_id::sparse_union:
                case type_id::utf8:
                case type_id::binary:
                case type_id::large_utf8:
                case type_id::large_binary:
                    return 1;
                default:
                    return static_cast<std::size_t>(std::clamp<std::int64_t>(fixed_width_bytes(physical), 1, 8));
            }
        }

        std::int64_t last_offset(const ArrowArray& array, const data_type& physical)
        {
            const void* offsets = array.buffers[1];
            if (offsets == nullptr)
            {
                return 0;
            }
            const std::int64_t end = array.offset + array.length;
            return offset_width(physical) == sizeof(std::int64_t) ? read_at<std::int64_t>(offsets, end)
                                                                  : read_at<std::int32_t>(offsets, end);
        }

        // Number of bytes of buffer i implied by the type, length and offset.
        std::size_t buffer_size(const ArrowArray& array, const data_type& physical, std::size_t i)
        {
            const std::int64_t end = array.offset + array.length;
            if (is_validity_buffer(physical, i) || (physical.id() == type_id::boolean && i == 1))
            {
                return static_cast<std::size_t>(bitmap::bytes_for_bits(end));
            }
            if (is_offsets_buffer(physical, i))
            {
                return static_cast<std::size_t>(end + 1) * offset_width(physical);
            }
            if (is_binary_like(physical.id()) && i == 2)
            {
                return static_cast<std::size_t>(last_offset(array, physical));
            }
            switch (physical.id())
            {
                case type_id::sparse_union:
                    return static_cast<std::size_t>(end);
                case type_id::dense_union:
                    return static_cast<std::size_t>(end) * (i == 0 ? sizeof(std::int8_t) : sizeof(std::int32_t));
                default:
                    return static_cast<std::size_t>(end * fixed_width_bytes(physical));
            }
        }

        bool may_be_null(const ArrowArray& array, const data_type& physical, std::size_t i)
        {
            if (is_validity_buffer(physical, i))
            {
                return true;
            }
            if (array.length == 0)
            {
                return true;
            }
            if (physical.id() == type_id::fixed_size_binary && physical.byte_width() == 0)
            {
                return true;
            }
            return is_binary_like(physical.id()) && i == 2 && last_offset(array, physical) == 0;
        }

        bool is_valid_at(const ArrowArray& array, const data_type& physical, std::int64_t i)
        {
            if (!has_validity_buffer(physical) || array.null_count == 0 || array.buffers[0] == nullptr)
            {
                return true;
            }
            return bitmap::get_bit(static_cast<const std::uint8_t*>(array.buffers[0]), array.offset + i);
        }

        std::int64_t read_index(const ArrowArray& array, const data_type& physical, std::int64_t i)
        {
            const void* values = array.buffers[1];
            const std::int64_t pos = array.offset + i;
            switch (physical.id())
            {
                // clang-format off
                case type_id::int8:   return read_at<std::int8_t>(values, pos);
                case type_id::uint8:  return read_at<std::uint8_t>(values, pos);
                case type_id::int16:  return read_at<std::int16_t>(values, pos);
                case type_id::uint16: return read_at<std::uint16_t>(values, pos);
                case type_id::int32:  return read_at<std::int32_t>(values, pos);
                case type_id::uint32: return read_at<std::uint32_t>(values, pos);
                case type_id::int64:  return read_at<std::int64_t>(values, pos);
                // clang-format on
                default:
                {
                    const auto index = read_at<std::uint64_t>(values, pos);
                    return index > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) ? -1 : static_cast<std::int64_t>(index);
                }
            }
        }

        class validator
        {
        public:

            explicit validator(const import_options& options)
                : m_options(options)
            {
            }

            void validate(const ArrowArray& array, const data_type& type, std::size_t depth) const
            {
                if (is_released(array))
                {
                    throw bridge_error(error_kind::use_after_release, to_string(type) + " ArrowArray has been released");
                }
                if (depth > m_options.max_recursion_depth)
                {
                    throw_mismatch(type, "is nested deeper than " + std::to_string(m_options.max_recursion_depth) + " levels");
                }
                check_header(array, type);
                check_buffers(array, type);
                check_children(array, type, depth);
                check_bounds(array, type);
            }

        private:

            void check_header(const ArrowArray& array, const data_type& type) const
            {
                if (array.length < 0 || array.offset < 0)
                {
                    throw_mismatch(type, "has a negative length or offset");
                }
                if (array.null_count < -1 || array.null_count > array.length)
                {
                    throw_mismatch(type, "has an invalid null count " + std::to_string(array.null_count));
                }
                check_extent(array, type);
            }

            // offset + length, and every buffer size derived from it, must fit in int64.
            void check_extent(const ArrowArray& array, const data_type& type) const
            {
                constexpr std::int64_t max_extent = std::numeric_limits<std::int64_t>::max();
                if (array.offset > max_extent - array.length)
                {
                    throw_bounds(
                        type,
                        "offset " + std::to_string(array.offset) + " plus length " + std::to_string(array.length)
                            + " overflows"
                    );
                }
                const std::int64_t end = array.offset + array.length;
                // Offsets buffers hold end + 1 elements of up to 8 bytes.
                const std::int64_t width = std::max<std::int64_t>(
                    fixed_width_bytes(physical_type(type)),
                    sizeof(std::int64_t)
                );
                if (end >= max_extent / width)
                {
                    throw_bounds(type, "extent " + std::to_string(end) + " overflows its buffer sizes");
                }
                if (type.id() == type_id::fixed_size_list && type.list_size() > 0 && end > max_extent / type.list_size())
                {
                    throw_bounds(
                        type,
                        "extent " + std::to_string(end) + " overflows the child extent for list size "
                            + std::to_string(type.list_size())
                    );
                }
            }

            void check_buffers(const ArrowArray& array, const data_type& type) const
            {
                const data_type& physical = physical_type(type);
                const auto expected = static_cast<std::int64_t>(layout_buffer_count(physical));
                if (array.n_buffers != expected)
                {
                    throw_mismatch(
                        type,
                        "has " + std::to_string(array.n_buffers) + " buffers, expected " + std::to_string(expected)
                    );
                }
                if (expected > 0 && array.buffers == nullptr)
                {
                    throw_mismatch(type, "has a null buffers pointer");
                }
                if (array.null_count > 0 && has_validity_buffer(physical) && array.buffers[0] == nullptr)
                {
                    throw_mismatch(type, "has nulls but no validity bitmap");
                }
                for (std::size_t i = 0; i < static_cast<std::size_t>(expected); ++i)
                {
                    if (array.buffers[i] == nullptr)
                    {
                        if (!may_be_null(array, physical, i))
                        {
                            throw_mismatch(type, "is missing buffer " + std::to_string(i));
                        }
                        continue;
                    }
                    if (!m_options.copy_misaligned_buffers
                        && !utils::is_aligned(array.buffers[i], required_alignment(physical, i)))
                    {
                        throw_bounds(type, "buffer " + std::to_string(i) + " is misaligned");
                    }
                }
            }

            void check_children(const ArrowArray& array, const data_type& type, std::size_t depth) const
            {
                const auto expected = static_cast<std::int64_t>(type.n_children());
                if (array.n_children != expected)
                {
                    throw_mismatch(
                        type,
                        "has " + std::to_string(array.n_children) + " children, expected " + std::to_string(expected)
                    );
                }
                if (expected > 0 && array.children == nullptr)
                {
                    throw_mismatch(type, "has a null children pointer");
                }
                for (std::int64_t i = 0; i < expected; ++i)
                {
                    if (array.children[i] == nullptr)
                    {
                        throw_mismatch(type, "has a null child " + std::to_string(i));
                    }
                    validate(*array.children[i], type.child(static_cast<std::size_t>(i)).type, depth + 1);
                }

                const bool is_dictionary = type.id() == type_id::dictionary;
                if (is_dictionary != (array.dictionary != nullptr))
                {
                    throw_mismatch(type, is_dictionary ? "has no dictionary" : "has an unexpected dictionary");
                }
                if (is_dictionary)
                {
                    validate(*array.dictionary, type.value_type(), depth + 1);
                }
            }

            void check_bounds(const ArrowArray& array, const data_type& type) const
            {
                if (array.length == 0)
                {
                    return;
                }
                const data_type& physical = physical_type(type);
                const std::int64_t end = array.offset + array.length;
                const type_id id = type.id();

                if (is_binary_like(id) || is_list_like(id))
                {
                    const void* offsets = array.buffers[1];
                    const bool large = offset_width(physical) == sizeof(std::int64_t);
                    const std::int64_t first = large ? read_at<std::int64_t>(offsets, array.offset)
                                                     : read_at<std::int32_t>(offsets, array.offset);
                    const std::int64_t last = last_offset(array, physical);
                    if (first < 0 || last < first)
                    {
                        throw_bounds(type, "offsets are not increasing between " + std::to_string(first) + " and "
                                               + std::to_string(last));
                    }
                    if (is_list_like(id) && last > array.children[0]->length)
                    {
                        throw_bounds(type, "offsets reach " + std::to_string(last) + " past a child of length "
                                               + std::to_string(array.children[0]->length));
                    }
                }
                else if (id == type_id::fixed_size_list)
                {
                    check_child_extent(array, type, 0, end * type.list_size());
                }
                else if (id == type_id::struct_)
                {
                    for (std::size_t i = 0; i < type.n_children(); ++i)
                    {
                        check_child_extent(array, type, i, end);
                    }
                }
                else if (is_union(id))
                {
                    check_union(array, type);
                }
                else if (id == type_id::dictionary)
                {
                    check_dictionary_indices(array, type);
                }
            }

            void
            check_child_extent(const ArrowArray& array, const data_type& type, std::size_t i, std::int64_t extent) const
            {
                const std::int64_t child_length = array.children[i]->length;
                if (child_length < extent)
                {
                    throw_bounds(
                        type,
                        "needs " + std::to_string(extent) + " elements in child " + std::to_string(i) + " of length "
                            + std::to_string(child_length)
                    );
                }
            }

            void check_union(const ArrowArray& array, const data_type& type) const
            {
                const auto& codes = type.type_codes();
                const bool dense = type.id() == type_id::dense_union;
                for (std::int64_t i = array.offset; i < array.offset + array.length; ++i)
                {
                    const auto code = read_at<std::int8_t>(array.buffers[0], i);
                    const auto it = std::find(codes.begin(), codes.end(), code);
                    if (it == codes.end())
                    {
                        throw_mismatch(type, "uses undeclared type code " + std::to_string(code));
                    }
                    const auto child_index = static_cast<std::size_t>(std::distance(codes.begin(), it));
                    const std::int64_t child_length = array.children[child_index]->length;
                    const std::int64_t child_offset = dense ? read_at<std::int32_t>(array.buffers[1], i) : i;
                    if (child_offset < 0 || child_offset >= child_length)
                    {
                        throw_bounds(
                            type,
                            "element " + std::to_string(i) + " points to " + std::to_string(child_offset)
                                + " in a child of length " + std::to_string(child_length)
                        );
                    }
                }
            }

            void check_dictionary_indices(const ArrowArray& array, const data_type& type) const
            {
                const data_type& physical = physical_type(type);
                const std::int64_t dictionary_length = array.dictionary->length;
                for (std::int64_t i = 0; i < array.length; ++i)
                {
                    if (!is_valid_at(array, physical, i))
                    {
                        continue;
                    }
                    const std::int64_t index = read_index(array, physical, i);
                    if (index < 0 || index >= dictionary_length)
                    {
                        throw_bounds(
                            type,
                            "index " + std::to_string(index) + " is out of a dictionary of length "
                                + std::to_string(dictionary_length)
                        );
                    }
                }
            }

            const import_options& m_options;
        };

        array_ptr wrap_node(
            const ArrowArray& array,
            const data_type& type,
            const std::shared_ptr<imported_array_handle>& handle
        )
        {
            const data_type& physical = physical_type(type);
            std::vector<buffer> buffers;
            buffers.reserve(static_cast<std::size_t>(array.n_buffers));
            for (std::size_t i = 0; i < static_cast<std::size_t>(array.n_buffers); ++i)
            {
                const auto* data = static_cast<const std::uint8_t*>(array.buffers[i]);
                if (data == nullptr)
                {
                    buffers.emplace_back();
                    continue;
                }
                const std::size_t size = buffer_size(array, physical, i);
                if (utils::is_aligned(data, required_alignment(physical, i)))
                {
                    buffers.push_back(buffer::borrowed(data, size, handle));
                }
                else
                {
                    sparrow::buffer<std::uint8_t> storage(size, std::uint8_t{0});
                    if (size > 0)
                    {
                        std::memcpy(storage.data(), data, size);
                    }
                    buffers.push_back(buffer::from_owned(std::move(storage)));
                }
            }

            std::vector<array_ptr> children;
            children.reserve(type.n_children());
            for (std::size_t i = 0; i < type.n_children(); ++i)
            {
                children.push_back(wrap_node(*array.children[i], type.child(i).type, handle));
            }

            array_ptr dictionary;
            if (type.id() == type_id::dictionary)
            {
                dictionary = wrap_node(*array.dictionary, type.value_type(), handle);
            }

            return std::make_shared<const array_data>(
                type,
                array.length,
                array.null_count,
                array.offset,
                std::move(buffers),
                std::move(children),
                std::move(dictionary)
            );
        }
    }

    array_ptr import_array(ArrowArray* array, const data_type& type, const import_options& options)
    {
        if (array == nullptr)
        {
            throw bridge_error(error_kind::use_after_release, "null ArrowArray");
        }
        validator(options).validate(*array, type, 0);
        auto handle = std::make_shared<imported_array_handle>(move_arrow_array(array));
        return wrap_node(handle->array(), type, handle);
    }
}

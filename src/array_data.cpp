#include "cdata_bridge/array_data.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

#include "cdata_bridge/bitmap.hpp"

namespace cdata_bridge
{
    namespace
    {
        std::int64_t compute_null_count(
            const data_type& type,
            const std::vector<buffer>& buffers,
            std::int64_t offset,
            std::int64_t length
        )
        {
            if (type.id() == type_id::na)
            {
                return length;
            }
            if (!has_validity_buffer(type) || buffers.empty())
            {
                return 0;
            }
            return bitmap::count_nulls(buffers[0].data(), offset, length);
        }

        const data_type& physical_type(const data_type& type)
        {
            return type.id() == type_id::dictionary ? type.index_type() : type;
        }
    }

    array_data::array_data(
        data_type type,
        std::int64_t length,
        std::int64_t null_count,
        std::int64_t offset,
        std::vector<buffer> buffers,
        std::vector<array_ptr> children,
        array_ptr dictionary
    )
        : m_type(std::move(type))
        , m_length(length)
        , m_null_count(null_count)
        , m_offset(offset)
        , m_buffers(std::move(buffers))
        , m_children(std::move(children))
        , m_dictionary(std::move(dictionary))
    {
        if (m_length < 0 || m_offset < 0)
        {
            throw std::invalid_argument("array_data length and offset must be non-negative");
        }
        if (m_null_count < 0 || m_type.id() == type_id::na)
        {
            m_null_count = compute_null_count(m_type, m_buffers, m_offset, m_length);
        }
    }

    const data_type& array_data::type() const noexcept
    {
        return m_type;
    }

    std::int64_t array_data::length() const noexcept
    {
        return m_length;
    }

    std::int64_t array_data::null_count() const noexcept
    {
        return m_null_count;
    }

    std::int64_t array_data::offset() const noexcept
    {
        return m_offset;
    }

    const std::vector<buffer>& array_data::buffers() const noexcept
    {
        return m_buffers;
    }

    const buffer& array_data::buffer_at(std::size_t i) const
    {
        return m_buffers.at(i);
    }

    const std::vector<array_ptr>& array_data::children() const noexcept
    {
        return m_children;
    }

    const array_ptr& array_data::child(std::size_t i) const
    {
        return m_children.at(i);
    }

    const array_ptr& array_data::dictionary() const noexcept
    {
        return m_dictionary;
    }

    bool array_data::is_null(std::int64_t i) const
    {
        const type_id id = m_type.id();
        if (id == type_id::na)
        {
            return true;
        }
        if (is_union(id))
        {
            return child(union_child_index(i))->is_null(union_child_offset(i));
        }
        if (m_null_count == 0 || m_buffers.empty() || m_buffers[0].is_absent())
        {
            return false;
        }
        return !bitmap::get_bit(m_buffers[0].data(), m_offset + i);
    }

    bool array_data::is_valid(std::int64_t i) const
    {
        return !is_null(i);
    }

    bool array_data::bool_value(std::int64_t i) const
    {
        return bitmap::get_bit(buffer_at(1).data(), m_offset + i);
    }

    std::string_view array_data::fixed_bytes(std::int64_t i) const
    {
        const auto width = fixed_width_bytes(m_type);
        const char* values = buffer_at(1).data_as<char>();
        return {values + (m_offset + i) * width, static_cast<std::size_t>(width)};
    }

    std::string_view array_data::string_value(std::int64_t i) const
    {
        const char* data = buffer_at(2).data_as<char>();
        std::int64_t begin = 0;
        std::int64_t end = 0;
        if (is_large_binary_like(m_type.id()))
        {
            const auto* offsets = buffer_at(1).data_as<std::int64_t>();
            begin = offsets[m_offset + i];
            end = offsets[m_offset + i + 1];
        }
        else
        {
            const auto* offsets = buffer_at(1).data_as<std::int32_t>();
            begin = offsets[m_offset + i];
            end = offsets[m_offset + i + 1];
        }
        if (begin == end)
        {
            return {};
        }
        return {data + begin, static_cast<std::size_t>(end - begin)};
    }

    std::pair<std::int64_t, std::int64_t> array_data::list_range(std::int64_t i) const
    {
        switch (m_type.id())
        {
            case type_id::list:
            case type_id::map:
            {
                const auto* offsets = buffer_at(1).data_as<std::int32_t>();
                return {offsets[m_offset + i], offsets[m_offset + i + 1]};
            }
            case type_id::large_list:
            {
                const auto* offsets = buffer_at(1).data_as<std::int64_t>();
                return {offsets[m_offset + i], offsets[m_offset + i + 1]};
            }
            case type_id::fixed_size_list:
            {
                const std::int64_t size = m_type.list_size();
                return {(m_offset + i) * size, (m_offset + i + 1) * size};
            }
            default:
                throw std::logic_error("list_range() called on " + to_string(m_type));
        }
    }

    std::int8_t array_data::union_type_code(std::int64_t i) const
    {
        return buffer_at(0).data_as<std::int8_t>()[m_offset + i];
    }

    std::size_t array_data::union_child_index(std::int64_t i) const
    {
        const std::int8_t code = union_type_code(i);
        const auto& codes = m_type.type_codes();
        const auto it = std::find(codes.begin(), codes.end(), code);
        if (it == codes.end())
        {
            throw std::out_of_range("Union type code " + std::to_string(code) + " is not declared by " + to_string(m_type));
        }
        return static_cast<std::size_t>(std::distance(codes.begin(), it));
    }

    std::int64_t array_data::union_child_offset(std::int64_t i) const
    {
        if (m_type.id() == type_id::dense_union)
        {
            return buffer_at(1).data_as<std::int32_t>()[m_offset + i];
        }
        return m_offset + i;
    }

    std::int64_t array_data::dictionary_index(std::int64_t i) const
    {
        switch (physical_type(m_type).id())
        {
            // clang-format off
            case type_id::int8:   return value<std::int8_t>(i);
            case type_id::uint8:  return value<std::uint8_t>(i);
            case type_id::int16:  return value<std::int16_t>(i);
            case type_id::uint16: return value<std::uint16_t>(i);
            case type_id::int32:  return value<std::int32_t>(i);
            case type_id::uint32: return value<std::uint32_t>(i);
            case type_id::int64:  return value<std::int64_t>(i);
            case type_id::uint64: return static_cast<std::int64_t>(value<std::uint64_t>(i));
            // clang-format on
            default:
                throw std::logic_error("dictionary_index() called on " + to_string(m_type));
        }
    }

    array_ptr array_data::slice(std::int64_t offset, std::int64_t length) const
    {
        if (offset < 0 || length < 0 || offset + length > m_length)
        {
            throw std::out_of_range(
                "Slice [" + std::to_string(offset) + ", " + std::to_string(offset + length)
                + ") is out of an array of length " + std::to_string(m_length)
            );
        }
        return std::make_shared<const array_data>(
            m_type,
            length,
            -1,
            m_offset + offset,
            m_buffers,
            m_children,
            m_dictionary
        );
    }
}

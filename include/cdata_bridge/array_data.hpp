#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "cdata_bridge/buffer.hpp"
#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    class array_data;

    using array_ptr = std::shared_ptr<const array_data>;

    /**
     * @brief In-process columnar array: a logical type plus the physical buffers,
     * children and dictionary that hold its values.
     *
     * Buffers follow the C Data Interface layout of the type (see
     * layout_buffer_count). The values of the array are the elements
     * [offset, offset + length) of its buffers; children are indexed with the same
     * offset for struct, fixed size list and sparse union layouts, and through the
     * offsets buffer for list, map and dense union layouts.
     *
     * Instances are immutable and shared through array_ptr.
     */
    class CDATA_BRIDGE_API array_data
    {
    public:

        /**
         * @param null_count Number of null values, or -1 to compute it from the
         *                   validity bitmap.
         */
        array_data(
            data_type type,
            std::int64_t length,
            std::int64_t null_count,
            std::int64_t offset,
            std::vector<buffer> buffers,
            std::vector<array_ptr> children = {},
            array_ptr dictionary = nullptr
        );

        [[nodiscard]] const data_type& type() const noexcept;
        [[nodiscard]] std::int64_t length() const noexcept;
        [[nodiscard]] std::int64_t null_count() const noexcept;
        [[nodiscard]] std::int64_t offset() const noexcept;

        [[nodiscard]] const std::vector<buffer>& buffers() const noexcept;
        [[nodiscard]] const buffer& buffer_at(std::size_t i) const;
        [[nodiscard]] const std::vector<array_ptr>& children() const noexcept;
        [[nodiscard]] const array_ptr& child(std::size_t i) const;
        [[nodiscard]] const array_ptr& dictionary() const noexcept;

        [[nodiscard]] bool is_null(std::int64_t i) const;
        [[nodiscard]] bool is_valid(std::int64_t i) const;

        // Value of element i of a fixed-width array, read as T.
        template <class T>
        [[nodiscard]] T value(std::int64_t i) const
        {
            return buffer_at(1).data_as<T>()[m_offset + i];
        }

        [[nodiscard]] bool bool_value(std::int64_t i) const;

        // Bytes of element i of a fixed size binary, decimal or other fixed-width array.
        [[nodiscard]] std::string_view fixed_bytes(std::int64_t i) const;

        // Bytes of element i of a utf8 or binary array, regular or large.
        [[nodiscard]] std::string_view string_value(std::int64_t i) const;

        // Range [begin, end) of element i in the child of a list-like or fixed size list array.
        [[nodiscard]] std::pair<std::int64_t, std::int64_t> list_range(std::int64_t i) const;

        [[nodiscard]] std::int8_t union_type_code(std::int64_t i) const;

        // Index of the child holding element i of a union array.
        [[nodiscard]] std::size_t union_child_index(std::int64_t i) const;

        // Position of element i in its union child.
        [[nodiscard]] std::int64_t union_child_offset(std::int64_t i) const;

        // Index stored at position i of a dictionary array.
        [[nodiscard]] std::int64_t dictionary_index(std::int64_t i) const;

        /**
         * @brief Returns a zero-copy view over [offset, offset + length) of this array.
         *
         * @throws std::out_of_range if the range is not within the array.
         */
        [[nodiscard]] array_ptr slice(std::int64_t offset, std::int64_t length) const;

    private:

        data_type m_type;
        std::int64_t m_length;
        std::int64_t m_null_count;
        std::int64_t m_offset;
        std::vector<buffer> m_buffers;
        std::vector<array_ptr> m_children;
        array_ptr m_dictionary;
    };
}

#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <sparrow/buffer/buffer.hpp>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/bitmap.hpp"
#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"

namespace cdata_bridge
{
    namespace detail
    {
        template <class T>
            requires std::is_trivially_copyable_v<T>
        [[nodiscard]] buffer buffer_from_values(const std::vector<T>& values)
        {
            sparrow::buffer<std::uint8_t> storage(values.size() * sizeof(T), std::uint8_t{0});
            if (!values.empty())
            {
                std::memcpy(storage.data(), values.data(), values.size() * sizeof(T));
            }
            return buffer::from_owned(std::move(storage));
        }

        // Validity buffer for the given flags, absent when every value is valid.
        [[nodiscard]] CDATA_BRIDGE_API buffer validity_buffer(const std::vector<bool>& validity);
    }

    template <class T>
    struct primitive_type_traits;

    // clang-format off
    template <> struct primitive_type_traits<std::int8_t>   { static constexpr type_id id = type_id::int8; };
    template <> struct primitive_type_traits<std::uint8_t>  { static constexpr type_id id = type_id::uint8; };
    template <> struct primitive_type_traits<std::int16_t>  { static constexpr type_id id = type_id::int16; };
    template <> struct primitive_type_traits<std::uint16_t> { static constexpr type_id id = type_id::uint16; };
    template <> struct primitive_type_traits<std::int32_t>  { static constexpr type_id id = type_id::int32; };
    template <> struct primitive_type_traits<std::uint32_t> { static constexpr type_id id = type_id::uint32; };
    template <> struct primitive_type_traits<std::int64_t>  { static constexpr type_id id = type_id::int64; };
    template <> struct primitive_type_traits<std::uint64_t> { static constexpr type_id id = type_id::uint64; };
    template <> struct primitive_type_traits<float>         { static constexpr type_id id = type_id::float32; };
    template <> struct primitive_type_traits<double>        { static constexpr type_id id = type_id::float64; };
    // clang-format on

    /**
     * @brief Builds a fixed-width array of @p type from optional values.
     *
     * The element size of @p type must be sizeof(T). Null slots hold T{}.
     */
    template <class T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] array_ptr make_fixed_width_array(data_type type, const std::vector<std::optional<T>>& values)
    {
        std::vector<T> raw;
        std::vector<bool> validity;
        raw.reserve(values.size());
        validity.reserve(values.size());
        for (const auto& v : values)
        {
            raw.push_back(v.value_or(T{}));
            validity.push_back(v.has_value());
        }
        std::vector<buffer> buffers;
        buffers.push_back(detail::validity_buffer(validity));
        buffers.push_back(detail::buffer_from_values(raw));
        return std::make_shared<const array_data>(
            std::move(type),
            static_cast<std::int64_t>(values.size()),
            -1,
            0,
            std::move(buffers)
        );
    }

    template <class T>
    [[nodiscard]] array_ptr make_primitive_array(const std::vector<std::optional<T>>& values)
    {
        return make_fixed_width_array<T>(data_type(primitive_type_traits<T>::id), values);
    }

    // Builds a primitive array without validity bitmap.
    template <class T>
    [[nodiscard]] array_ptr make_non_null_array(const std::vector<T>& values)
    {
        std::vector<buffer> buffers;
        buffers.emplace_back();
        buffers.push_back(detail::buffer_from_values(values));
        return std::make_shared<const array_data>(
            data_type(primitive_type_traits<T>::id),
            static_cast<std::int64_t>(values.size()),
            0,
            0,
            std::move(buffers)
        );
    }

    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_null_array(std::int64_t length);

    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_boolean_array(const std::vector<std::optional<bool>>& values);

    /**
     * @brief Builds a utf8, binary, large_utf8 or large_binary array.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr
    make_string_array(const std::vector<std::optional<std::string>>& values, type_id id = type_id::utf8);

    [[nodiscard]] CDATA_BRIDGE_API array_ptr
    make_fixed_size_binary_array(std::int32_t byte_width, const std::vector<std::optional<std::string>>& values);

    /**
     * @brief Builds a list (or large list) array over @p values.
     *
     * @param offsets length + 1 offsets into @p values.
     * @param validity Optional validity flags, one per list.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_list_array(
        const std::vector<std::int64_t>& offsets,
        array_ptr values,
        std::optional<std::vector<bool>> validity = std::nullopt,
        bool large = false
    );

    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_fixed_size_list_array(
        std::int32_t list_size,
        array_ptr values,
        std::optional<std::vector<bool>> validity = std::nullopt
    );

    /**
     * @brief Builds a map array whose entry i spans keys and items [offsets[i], offsets[i + 1]).
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_map_array(
        const std::vector<std::int64_t>& offsets,
        array_ptr keys,
        array_ptr items,
        std::optional<std::vector<bool>> validity = std::nullopt,
        bool keys_sorted = false
    );

    /**
     * @brief Builds a struct array. All children must have the same length.
     *
     * @param names One name per child.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_struct_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        std::optional<std::vector<bool>> validity = std::nullopt
    );

    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_sparse_union_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        const std::vector<std::int8_t>& type_ids,
        std::vector<std::int8_t> type_codes = {}
    );

    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_dense_union_array(
        const std::vector<std::string>& names,
        std::vector<array_ptr> children,
        const std::vector<std::int8_t>& type_ids,
        const std::vector<std::int32_t>& value_offsets,
        std::vector<std::int8_t> type_codes = {}
    );

    /**
     * @brief Builds a dictionary-encoded array from integer indices and dictionary values.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr
    make_dictionary_array(const array_ptr& indices, array_ptr dictionary, bool ordered = false);

    /**
     * @brief Builds a structurally valid zero-length array of any supported type.
     *
     * Offsets buffers hold a single zero, other buffers are absent, children and
     * dictionaries are themselves empty arrays.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr make_empty_array(const data_type& type);
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sparrow/utils/metadata.hpp>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    enum class type_id : std::uint8_t
    {
        na,
        boolean,
        int8,
        uint8,
        int16,
        uint16,
        int32,
        uint32,
        int64,
        uint64,
        float16,
        float32,
        float64,
        decimal128,
        decimal256,
        fixed_size_binary,
        utf8,
        binary,
        large_utf8,
        large_binary,
        date32,
        date64,
        time32,
        time64,
        timestamp,
        duration,
        interval_months,
        interval_day_time,
        interval_month_day_nano,
        list,
        large_list,
        fixed_size_list,
        struct_,
        map,
        sparse_union,
        dense_union,
        dictionary
    };

    enum class time_unit : std::uint8_t
    {
        second,
        milli,
        micro,
        nano
    };

    using metadata_type = std::vector<sparrow::metadata_pair>;

    struct field;

    /**
     * @brief Logical type of a value sequence.
     *
     * A tagged value over the primitive, variable-length and composite kinds that
     * the C Data Interface can describe. Composite kinds own their children as
     * fields; a dictionary type owns its index and value types.
     *
     * Parameters that do not apply to the type id are left at their defaults.
     * Constructing a type never fails: whether a type has a format token is
     * decided by the format codec.
     */
    class CDATA_BRIDGE_API data_type
    {
    public:

        data_type();
        explicit data_type(type_id id);

        data_type(const data_type&);
        data_type(data_type&&) noexcept;
        data_type& operator=(const data_type&);
        data_type& operator=(data_type&&) noexcept;
        ~data_type();

        [[nodiscard]] static data_type fixed_size_binary(std::int32_t byte_width);
        [[nodiscard]] static data_type decimal128(std::int32_t precision, std::int32_t scale);
        [[nodiscard]] static data_type decimal256(std::int32_t precision, std::int32_t scale);
        [[nodiscard]] static data_type time32(time_unit unit);
        [[nodiscard]] static data_type time64(time_unit unit);
        [[nodiscard]] static data_type timestamp(time_unit unit, std::string timezone = {});
        [[nodiscard]] static data_type duration(time_unit unit);
        [[nodiscard]] static data_type list(field value_field);
        [[nodiscard]] static data_type large_list(field value_field);
        [[nodiscard]] static data_type fixed_size_list(field value_field, std::int32_t list_size);
        [[nodiscard]] static data_type struct_(std::vector<field> fields);

        /**
         * Builds a map type. The single child is a non-nullable struct named
         * "entries" holding the key and item fields.
         */
        [[nodiscard]] static data_type map(field key_field, field item_field, bool keys_sorted = false);

        /**
         * Builds a union type. When @p type_codes is empty, the codes default to
         * the child positions.
         */
        [[nodiscard]] static data_type
        sparse_union(std::vector<field> fields, std::vector<std::int8_t> type_codes = {});
        [[nodiscard]] static data_type
        dense_union(std::vector<field> fields, std::vector<std::int8_t> type_codes = {});
        [[nodiscard]] static data_type dictionary(data_type index_type, data_type value_type, bool ordered = false);

        [[nodiscard]] type_id id() const noexcept;

        [[nodiscard]] std::int32_t byte_width() const noexcept;
        [[nodiscard]] std::int32_t list_size() const noexcept;
        [[nodiscard]] std::int32_t precision() const noexcept;
        [[nodiscard]] std::int32_t scale() const noexcept;
        [[nodiscard]] time_unit unit() const noexcept;
        [[nodiscard]] const std::string& timezone() const noexcept;

        [[nodiscard]] const std::vector<field>& children() const noexcept;
        [[nodiscard]] const field& child(std::size_t i) const;
        [[nodiscard]] std::size_t n_children() const noexcept;

        [[nodiscard]] const std::vector<std::int8_t>& type_codes() const noexcept;
        [[nodiscard]] bool keys_sorted() const noexcept;

        [[nodiscard]] const data_type& index_type() const;
        [[nodiscard]] const data_type& value_type() const;
        [[nodiscard]] bool ordered() const noexcept;

    private:

        type_id m_id = type_id::na;
        std::int32_t m_width = 0;
        std::int32_t m_scale = 0;
        time_unit m_unit = time_unit::second;
        std::string m_timezone;
        std::vector<field> m_children;
        std::vector<std::int8_t> m_type_codes;
        std::shared_ptr<const data_type> m_index_type;
        std::shared_ptr<const data_type> m_value_type;
        bool m_flag = false;
    };

    CDATA_BRIDGE_API bool operator==(const data_type& lhs, const data_type& rhs);

    /**
     * @brief A named, possibly nullable, logical type with optional metadata.
     */
    struct CDATA_BRIDGE_API field
    {
        field(std::string field_name, data_type field_type, bool is_nullable = true);
        field(std::string field_name, data_type field_type, bool is_nullable, std::optional<metadata_type> field_metadata);

        std::string name;
        data_type type;
        bool nullable = true;
        std::optional<metadata_type> metadata;
    };

    CDATA_BRIDGE_API bool operator==(const field& lhs, const field& rhs);

    [[nodiscard]] CDATA_BRIDGE_API std::string_view to_string(type_id id) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API std::string to_string(const data_type& type);

    [[nodiscard]] CDATA_BRIDGE_API bool is_integer(type_id id) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API bool is_binary_like(type_id id) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API bool is_large_binary_like(type_id id) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API bool is_list_like(type_id id) noexcept;
    [[nodiscard]] CDATA_BRIDGE_API bool is_union(type_id id) noexcept;

    // Size in bytes of one element of a fixed-width type, 0 for other types.
    // Booleans are bit-packed and also return 0.
    [[nodiscard]] CDATA_BRIDGE_API std::int64_t fixed_width_bytes(const data_type& type) noexcept;

    /**
     * @brief Number of buffers the C Data Interface defines for the physical layout of a type.
     *
     * A dictionary type uses the layout of its index type.
     */
    [[nodiscard]] CDATA_BRIDGE_API std::size_t layout_buffer_count(const data_type& type) noexcept;

    // Whether the layout starts with a validity bitmap. Null and union layouts do not.
    [[nodiscard]] CDATA_BRIDGE_API bool has_validity_buffer(const data_type& type) noexcept;
}

#include "cdata_bridge/data_type.hpp"

#include <numeric>
#include <stdexcept>
#include <utility>

namespace cdata_bridge
{
    data_type::data_type() = default;

    data_type::data_type(type_id id)
        : m_id(id)
    {
    }

    data_type::data_type(const data_type&) = default;
    data_type::data_type(data_type&&) noexcept = default;
    data_type& data_type::operator=(const data_type&) = default;
    data_type& data_type::operator=(data_type&&) noexcept = default;
    data_type::~data_type() = default;

    data_type data_type::fixed_size_binary(std::int32_t byte_width)
    {
        data_type res(type_id::fixed_size_binary);
        res.m_width = byte_width;
        return res;
    }

    data_type data_type::decimal128(std::int32_t precision, std::int32_t scale)
    {
        data_type res(type_id::decimal128);
        res.m_width = precision;
        res.m_scale = scale;
        return res;
    }

    data_type data_type::decimal256(std::int32_t precision, std::int32_t scale)
    {
        data_type res(type_id::decimal256);
        res.m_width = precision;
        res.m_scale = scale;
        return res;
    }

    data_type data_type::time32(time_unit unit)
    {
        data_type res(type_id::time32);
        res.m_unit = unit;
        return res;
    }

    data_type data_type::time64(time_unit unit)
    {
        data_type res(type_id::time64);
        res.m_unit = unit;
        return res;
    }

    data_type data_type::timestamp(time_unit unit, std::string timezone)
    {
        data_type res(type_id::timestamp);
        res.m_unit = unit;
        res.m_timezone = std::move(timezone);
        return res;
    }

    data_type data_type::duration(time_unit unit)
    {
        data_type res(type_id::duration);
        res.m_unit = unit;
        return res;
    }

    data_type data_type::list(field value_field)
    {
        data_type res(type_id::list);
        res.m_children.push_back(std::move(value_field));
        return res;
    }

    data_type data_type::large_list(field value_field)
    {
        data_type res(type_id::large_list);
        res.m_children.push_back(std::move(value_field));
        return res;
    }

    data_type data_type::fixed_size_list(field value_field, std::int32_t list_size)
    {
        data_type res(type_id::fixed_size_list);
        res.m_children.push_back(std::move(value_field));
        res.m_width = list_size;
        return res;
    }

    data_type data_type::struct_(std::vector<field> fields)
    {
        data_type res(type_id::struct_);
        res.m_children = std::move(fields);
        return res;
    }

    data_type data_type::map(field key_field, field item_field, bool keys_sorted)
    {
        std::vector<field> entries;
        entries.reserve(2);
        entries.push_back(std::move(key_field));
        entries.push_back(std::move(item_field));
        data_type res(type_id::map);
        res.m_children.emplace_back("entries", struct_(std::move(entries)), false);
        res.m_flag = keys_sorted;
        return res;
    }

    namespace
    {
        std::vector<std::int8_t> default_type_codes(std::size_t n_children, std::vector<std::int8_t> type_codes)
        {
            if (type_codes.empty())
            {
                type_codes.resize(n_children);
                std::iota(type_codes.begin(), type_codes.end(), std::int8_t{0});
            }
            return type_codes;
        }
    }

    data_type data_type::sparse_union(std::vector<field> fields, std::vector<std::int8_t> type_codes)
    {
        data_type res(type_id::sparse_union);
        res.m_type_codes = default_type_codes(fields.size(), std::move(type_codes));
        res.m_children = std::move(fields);
        return res;
    }

    data_type data_type::dense_union(std::vector<field> fields, std::vector<std::int8_t> type_codes)
    {
        data_type res(type_id::dense_union);
        res.m_type_codes = default_type_codes(fields.size(), std::move(type_codes));
        res.m_children = std::move(fields);
        return res;
    }

    data_type data_type::dictionary(data_type index_type, data_type value_type, bool ordered)
    {
        data_type res(type_id::dictionary);
        res.m_index_type = std::make_shared<const data_type>(std::move(index_type));
        res.m_value_type = std::make_shared<const data_type>(std::move(value_type));
        res.m_flag = ordered;
        return res;
    }

    type_id data_type::id() const noexcept
    {
        return m_id;
    }

    std::int32_t data_type::byte_width() const noexcept
    {
        return m_id == type_id::fixed_size_binary ? m_width : 0;
    }

    std::int32_t data_type::list_size() const noexcept
    {
        return m_id == type_id::fixed_size_list ? m_width : 0;
    }

    std::int32_t data_type::precision() const noexcept
    {
        return (m_id == type_id::decimal128 || m_id == type_id::decimal256) ? m_width : 0;
    }

    std::int32_t data_type::scale() const noexcept
    {
        return m_scale;
    }

    time_unit data_type::unit() const noexcept
    {
        return m_unit;
    }

    const std::string& data_type::timezone() const noexcept
    {
        return m_timezone;
    }

    const std::vector<field>& data_type::children() const noexcept
    {
        return m_children;
    }

    const field& data_type::child(std::size_t i) const
    {
        return m_children.at(i);
    }

    std::size_t data_type::n_children() const noexcept
    {
        return m_children.size();
    }

    const std::vector<std::int8_t>& data_type::type_codes() const noexcept
    {
        return m_type_codes;
    }

    bool data_type::keys_sorted() const noexcept
    {
        return m_id == type_id::map && m_flag;
    }

    const data_type& data_type::index_type() const
    {
        if (m_index_type == nullptr)
        {
            throw std::logic_error("index_type() called on non-dictionary type " + to_string(*this));
        }
        return *m_index_type;
    }

    const data_type& data_type::value_type() const
    {
        if (m_value_type == nullptr)
        {
            throw std::logic_error("value_type() called on non-dictionary type " + to_string(*this));
        }
        return *m_value_type;
    }

    bool data_type::ordered() const noexcept
    {
        return m_id == type_id::dictionary && m_flag;
    }

    bool operator==(const data_type& lhs, const data_type& rhs)
    {
        if (lhs.id() != rhs.id())
        {
            return false;
        }
        switch (lhs.id())
        {
            case type_id::fixed_size_binary:
                return lhs.byte_width() == rhs.byte_width();
            case type_id::decimal128:
            case type_id::decimal256:
                return lhs.precision() == rhs.precision() && lhs.scale() == rhs.scale();
            case type_id::time32:
            case type_id::time64:
            case type_id::duration:
                return lhs.unit() == rhs.unit();
            case type_id::timestamp:
                return lhs.unit() == rhs.unit() && lhs.timezone() == rhs.timezone();
            case type_id::list:
            case type_id::large_list:
            case type_id::struct_:
                return lhs.children() == rhs.children();
            case type_id::fixed_size_list:
                return lhs.list_size() == rhs.list_size() && lhs.children() == rhs.children();
            case type_id::map:
                return lhs.keys_sorted() == rhs.keys_sorted() && lhs.children() == rhs.children();
            case type_id::sparse_union:
            case type_id::dense_union:
                return lhs.type_codes() == rhs.type_codes() && lhs.children() == rhs.children();
            case type_id::dictionary:
                return lhs.ordered() == rhs.ordered() && lhs.index_type() == rhs.index_type()
                       && lhs.value_type() == rhs.value_type();
            default:
                return true;
        }
    }

    field::field(std::string field_name, data_type field_type, bool is_nullable)
        : name(std::move(field_name))
        , type(std::move(field_type))
        , nullable(is_nullable)
    {
    }

    field::field(
        std::string field_name,
        data_type field_type,
        bool is_nullable,
        std::optional<metadata_type> field_metadata
    )
        : name(std::move(field_name))
        , type(std::move(field_type))
        , nullable(is_nullable)
        , metadata(std::move(field_metadata))
    {
    }

    bool operator==(const field& lhs, const field& rhs)
    {
        return lhs.name == rhs.name && lhs.nullable == rhs.nullable && lhs.metadata == rhs.metadata
               && lhs.type == rhs.type;
    }

    std::string_view to_string(type_id id) noexcept
    {
        switch (id)
        {
            // clang-format off
            case type_id::na: return "null";
            case type_id::boolean: return "bool";
            case type_id::int8: return "int8";
            case type_id::uint8: return "uint8";
            case type_id::int16: return "int16";
            case type_id::uint16: return "uint16";
            case type_id::int32: return "int32";
            case type_id::uint32: return "uint32";
            case type_id::int64: return "int64";
            case type_id::uint64: return "uint64";
            case type_id::float16: return "halffloat";
            case type_id::float32: return "float";
            case type_id::float64: return "double";
            case type_id::decimal128: return "decimal128";
            case type_id::decimal256: return "decimal256";
            case type_id::fixed_size_binary: return "fixed_size_binary";
            case type_id::utf8: return "string";
            case type_id::binary: return "binary";
            case type_id::large_utf8: return "large_string";
            case type_id::large_binary: return "large_binary";
            case type_id::date32: return "date32";
            case type_id::date64: return "date64";
            case type_id::time32: return "time32";
            case type_id::time64: return "time64";
            case type_id::timestamp: return "timestamp";
            case type_id::duration: return "duration";
            case type_id::interval_months: return "month_interval";
            case type_id::interval_day_time: return "day_time_interval";
            case type_id::interval_month_day_nano: return "month_day_nano_interval";
            case type_id::list: return "list";
            case type_id::large_list: return "large_list";
            case type_id::fixed_size_list: return "fixed_size_list";
            case type_id::struct_: return "struct";
            case type_id::map: return "map";
            case type_id::sparse_union: return "sparse_union";
            case type_id::dense_union: return "dense_union";
            case type_id::dictionary: return "dictionary";
            // clang-format on
        }
        return "unknown";
    }

    namespace
    {
        std::string_view unit_suffix(time_unit unit)
        {
            switch (unit)
            {
                case time_unit::second:
                    return "s";
                case time_unit::milli:
                    return "ms";
                case time_unit::micro:
                    return "us";
                case time_unit::nano:
                    return "ns";
            }
            return "?";
        }

        std::string children_to_string(const std::vector<field>& children)
        {
            std::string res;
            for (std::size_t i = 0; i < children.size(); ++i)
            {
                if (i != 0)
                {
                    res += ", ";
                }
                res += children[i].name + ": " + to_string(children[i].type);
            }
            return res;
        }
    }

    std::string to_string(const data_type& type)
    {
        const std::string name(to_string(type.id()));
        switch (type.id())
        {
            case type_id::fixed_size_binary:
                return name + "[" + std::to_string(type.byte_width()) + "]";
            case type_id::decimal128:
            case type_id::decimal256:
                return name + "(" + std::to_string(type.precision()) + ", " + std::to_string(type.scale()) + ")";
            case type_id::time32:
            case type_id::time64:
            case type_id::duration:
                return name + "[" + std::string(unit_suffix(type.unit())) + "]";
            case type_id::timestamp:
                return name + "[" + std::string(unit_suffix(type.unit()))
                       + (type.timezone().empty() ? "" : ", tz=" + type.timezone()) + "]";
            case type_id::list:
            case type_id::large_list:
            case type_id::map:
            case type_id::struct_:
            case type_id::sparse_union:
            case type_id::dense_union:
                return name + "<" + children_to_string(type.children()) + ">";
            case type_id::fixed_size_list:
                return name + "<" + children_to_string(type.children()) + ">[" + std::to_string(type.list_size())
                       + "]";
            case type_id::dictionary:
                return name + "<values=" + to_string(type.value_type()) + ", indices=" + to_string(type.index_type())
                       + (type.ordered() ? ", ordered" : "") + ">";
            default:
                return name;
        }
    }

    bool is_integer(type_id id) noexcept
    {
        switch (id)
        {
            case type_id::int8:
            case type_id::uint8:
            case type_id::int16:
            case type_id::uint16:
            case type_id::int32:
            case type_id::uint32:
            case type_id::int64:
            case type_id::uint64:
                return true;
            default:
                return false;
        }
    }

    bool is_binary_like(type_id id) noexcept
    {
        return id == type_id::utf8 || id == type_id::binary || is_large_binary_like(id);
    }

    bool is_large_binary_like(type_id id) noexcept
    {
        return id == type_id::large_utf8 || id == type_id::large_binary;
    }

    bool is_list_like(type_id id) noexcept
    {
        return id == type_id::list || id == type_id::large_list || id == type_id::map;
    }

    bool is_union(type_id id) noexcept
    {
        return id == type_id::sparse_union || id == type_id::dense_union;
    }

    std::int64_t fixed_width_bytes(const data_type& type) noexcept
    {
        switch (type.id())
        {
            case type_id::int8:
            case type_id::uint8:
                return 1;
            case type_id::int16:
            case type_id::uint16:
            case type_id::float16:
                return 2;
            case type_id::int32:
            case type_id::uint32:
            case type_id::float32:
            case type_id::date32:
            case type_id::time32:
            case type_id::interval_months:
                return 4;
            case type_id::int64:
            case type_id::uint64:
            case type_id::float64:
            case type_id::date64:
            case type_id::time64:
            case type_id::timestamp:
            case type_id::duration:
            case type_id::interval_day_time:
                return 8;
            case type_id::decimal128:
            case type_id::interval_month_day_nano:
                return 16;
            case type_id::decimal256:
                return 32;
            case type_id::fixed_size_binary:
                return type.byte_width();
            default:
                return 0;
        }
    }

    std::size_t layout_buffer_count(const data_type& type) noexcept
    {
        switch (type.id())
        {
            case type_id::na:
                return 0;
            case type_id::utf8:
            case type_id::binary:
            case type_id::large_utf8:
            case type_id::large_binary:
                return 3;
            case type_id::fixed_size_list:
            case type_id::struct_:
            case type_id::sparse_union:
                return 1;
            case type_id::dense_union:
                return 2;
            default:
                return 2;
        }
    }

    bool has_validity_buffer(const data_type& type) noexcept
    {
        return type.id() != type_id::na && !is_union(type.id());
    }
}

#include "cdata_bridge/format.hpp"

#include <exception>
#include <optional>
#include <set>
#include <utility>

#include <sparrow/types/data_type.hpp>

#include "cdata_bridge/bridge_error.hpp"
#include "cdata_bridge/utils.hpp"

namespace cdata_bridge
{
    namespace
    {
        constexpr std::int32_t max_decimal128_precision = 38;
        constexpr std::int32_t max_decimal256_precision = 76;

        [[noreturn]] void throw_unsupported(const data_type& type, std::string_view reason)
        {
            throw bridge_error(error_kind::unsupported_type, to_string(type) + " " + std::string(reason));
        }

        [[noreturn]] void throw_malformed(std::string_view format)
        {
            throw bridge_error(error_kind::malformed_format_string, "'" + std::string(format) + "'");
        }

        sparrow::data_type unit_kind(
            time_unit unit,
            sparrow::data_type second,
            sparrow::data_type milli,
            sparrow::data_type micro,
            sparrow::data_type nano
        )
        {
            switch (unit)
            {
                case time_unit::second:
                    return second;
                case time_unit::milli:
                    return milli;
                case time_unit::micro:
                    return micro;
                case time_unit::nano:
                    return nano;
            }
            return second;
        }

        // sparrow kind whose format token prefixes the one of type.
        sparrow::data_type sparrow_kind(const data_type& type)
        {
            using sdt = sparrow::data_type;
            switch (type.id())
            {
                // clang-format off
                case type_id::na:                      return sdt::NA;
                case type_id::boolean:                 return sdt::BOOL;
                case type_id::int8:                    return sdt::INT8;
                case type_id::uint8:                   return sdt::UINT8;
                case type_id::int16:                   return sdt::INT16;
                case type_id::uint16:                  return sdt::UINT16;
                case type_id::int32:                   return sdt::INT32;
                case type_id::uint32:                  return sdt::UINT32;
                case type_id::int64:                   return sdt::INT64;
                case type_id::uint64:                  return sdt::UINT64;
                case type_id::float16:                 return sdt::HALF_FLOAT;
                case type_id::float32:                 return sdt::FLOAT;
                case type_id::float64:                 return sdt::DOUBLE;
                case type_id::utf8:                    return sdt::STRING;
                case type_id::binary:                  return sdt::BINARY;
                case type_id::large_utf8:              return sdt::LARGE_STRING;
                case type_id::large_binary:            return sdt::LARGE_BINARY;
                case type_id::fixed_size_binary:       return sdt::FIXED_WIDTH_BINARY;
                case type_id::decimal128:              return sdt::DECIMAL128;
                case type_id::decimal256:              return sdt::DECIMAL256;
                case type_id::date32:                  return sdt::DATE_DAYS;
                case type_id::date64:                  return sdt::DATE_MILLISECONDS;
                case type_id::interval_months:         return sdt::INTERVAL_MONTHS;
                case type_id::interval_day_time:       return sdt::INTERVAL_DAYS_TIME;
                case type_id::interval_month_day_nano: return sdt::INTERVAL_MONTHS_DAYS_NANOSECONDS;
                case type_id::list:                    return sdt::LIST;
                case type_id::large_list:              return sdt::LARGE_LIST;
                case type_id::fixed_size_list:         return sdt::FIXED_SIZED_LIST;
                case type_id::struct_:                 return sdt::STRUCT;
                case type_id::map:                     return sdt::MAP;
                case type_id::sparse_union:            return sdt::SPARSE_UNION;
                case type_id::dense_union:             return sdt::DENSE_UNION;
                // clang-format on
                case type_id::time32:
                case type_id::time64:
                    return unit_kind(type.unit(), sdt::TIME_SECONDS, sdt::TIME_MILLISECONDS, sdt::TIME_MICROSECONDS, sdt::TIME_NANOSECONDS);
                case type_id::timestamp:
                    return unit_kind(
                        type.unit(),
                        sdt::TIMESTAMP_SECONDS,
                        sdt::TIMESTAMP_MILLISECONDS,
                        sdt::TIMESTAMP_MICROSECONDS,
                        sdt::TIMESTAMP_NANOSECONDS
                    );
                case type_id::duration:
                    return unit_kind(
                        type.unit(),
                        sdt::DURATION_SECONDS,
                        sdt::DURATION_MILLISECONDS,
                        sdt::DURATION_MICROSECONDS,
                        sdt::DURATION_NANOSECONDS
                    );
                case type_id::dictionary:
                    break;
            }
            throw bridge_error(
                error_kind::unsupported_type,
                "type id " + std::to_string(static_cast<int>(type.id())) + " has no format token"
            );
        }

        // Format token prefix of a kind, without the ':' that introduces parameters.
        std::string kind_token(sparrow::data_type kind)
        {
            std::string token(sparrow::data_type_to_format(kind));
            if (const auto colon = token.find(':'); colon != std::string::npos)
            {
                token.erase(colon);
            }
            return token;
        }

        std::string encode_type_codes(const data_type& type)
        {
            const auto& codes = type.type_codes();
            if (codes.size() != type.n_children())
            {
                throw_unsupported(type, "declares " + std::to_string(codes.size()) + " type codes for "
                                            + std::to_string(type.n_children()) + " children");
            }
            std::set<std::int8_t> seen;
            std::string res;
            for (std::size_t i = 0; i < codes.size(); ++i)
            {
                if (codes[i] < 0 || !seen.insert(codes[i]).second)
                {
                    throw_unsupported(type, "has a negative or duplicated type code");
                }
                if (i != 0)
                {
                    res += ',';
                }
                res += std::to_string(codes[i]);
            }
            return res;
        }

        void check_children_count(const data_type& type, std::size_t expected)
        {
            if (type.n_children() != expected)
            {
                throw_unsupported(type, "must have " + std::to_string(expected) + " children");
            }
        }
    }

    std::string encode_format(const data_type& type)
    {
        if (type.id() == type_id::dictionary)
        {
            if (!is_integer(type.index_type().id()))
            {
                throw_unsupported(type, "has a non-integer index type");
            }
            return encode_format(type.index_type());
        }

        const sparrow::data_type kind = sparrow_kind(type);
        const std::string token = kind_token(kind);
        switch (type.id())
        {
            case type_id::fixed_size_binary:
                if (type.byte_width() < 0)
                {
                    throw_unsupported(type, "has a negative byte width");
                }
                return token + ":" + std::to_string(type.byte_width());
            case type_id::decimal128:
            case type_id::decimal256:
            {
                const bool is_256 = type.id() == type_id::decimal256;
                const std::int32_t max_precision = is_256 ? max_decimal256_precision : max_decimal128_precision;
                if (type.precision() < 1 || type.precision() > max_precision)
                {
                    throw_unsupported(type, "has an out of range precision");
                }
                return token + ":" + std::to_string(type.precision()) + "," + std::to_string(type.scale())
                       + (is_256 ? ",256" : "");
            }
            case type_id::time32:
                if (type.unit() != time_unit::second && type.unit() != time_unit::milli)
                {
                    throw_unsupported(type, "requires a second or millisecond unit");
                }
                return token;
            case type_id::time64:
                if (type.unit() != time_unit::micro && type.unit() != time_unit::nano)
                {
                    throw_unsupported(type, "requires a microsecond or nanosecond unit");
                }
                return token;
            case type_id::timestamp:
                return token + ":" + type.timezone();
            case type_id::list:
            case type_id::large_list:
                check_children_count(type, 1);
                return token;
            case type_id::fixed_size_list:
                check_children_count(type, 1);
                if (type.list_size() < 0)
                {
                    throw_unsupported(type, "has a negative list size");
                }
                return token + ":" + std::to_string(type.list_size());
            case type_id::map:
                check_children_count(type, 1);
                if (type.child(0).type.id() != type_id::struct_ || type.child(0).type.n_children() != 2)
                {
                    throw_unsupported(type, "entries must be a struct of key and item");
                }
                return token;
            case type_id::sparse_union:
            case type_id::dense_union:
                return token + ":" + encode_type_codes(type);
            default:
                return token;
        }
    }

    namespace
    {
        void expect_children(std::string_view format, const std::vector<field>& children, std::size_t expected)
        {
            if (children.size() != expected)
            {
                throw bridge_error(
                    error_kind::child_arity_mismatch,
                    "'" + std::string(format) + "' expects " + std::to_string(expected) + " children, got "
                        + std::to_string(children.size())
                );
            }
        }

        sparrow::data_type recognize(std::string_view format)
        {
            sparrow::data_type kind = sparrow::data_type::NA;
            try
            {
                kind = sparrow::format_to_data_type(format);
            }
            catch (const std::exception&)
            {
                throw_malformed(format);
            }
            // Unknown single characters are reported as NA.
            if (kind == sparrow::data_type::NA && format != "n")
            {
                throw_malformed(format);
            }
            return kind;
        }

        // The token must be the kind's token, followed by ':' and parameters when has_parameters.
        std::string_view parameters_of(std::string_view format, sparrow::data_type kind, bool has_parameters)
        {
            const std::string token = kind_token(kind);
            if (!format.starts_with(token))
            {
                throw_malformed(format);
            }
            const std::string_view rest = format.substr(token.size());
            if (!has_parameters)
            {
                if (!rest.empty())
                {
                    throw_malformed(format);
                }
                return rest;
            }
            if (rest.empty() || rest[0] != ':')
            {
                throw_malformed(format);
            }
            return rest.substr(1);
        }

        std::int32_t parse_non_negative(std::string_view format, std::string_view digits)
        {
            const auto value = utils::parse_to_int32(digits);
            if (!value.has_value() || *value < 0)
            {
                throw_malformed(format);
            }
            return *value;
        }

        data_type decode_decimal(std::string_view format)
        {
            const auto parsed = utils::parse_decimal_format(format);
            if (!parsed.has_value())
            {
                throw_malformed(format);
            }
            const auto& [precision, scale, bit_width] = *parsed;
            if (precision < 1)
            {
                throw_malformed(format);
            }
            if (!bit_width.has_value() || *bit_width == 128)
            {
                if (precision > max_decimal128_precision)
                {
                    throw_malformed(format);
                }
                return data_type::decimal128(precision, scale);
            }
            if (*bit_width == 256 && precision <= max_decimal256_precision)
            {
                return data_type::decimal256(precision, scale);
            }
            throw_malformed(format);
        }

        std::vector<std::int8_t> decode_type_codes(std::string_view format)
        {
            std::vector<std::int8_t> codes;
            std::set<std::int32_t> seen;
            for (const auto word : utils::extract_words_after_colon(format))
            {
                const std::int32_t code = parse_non_negative(format, word);
                if (code > 127 || !seen.insert(code).second)
                {
                    throw_malformed(format);
                }
                codes.push_back(static_cast<std::int8_t>(code));
            }
            return codes;
        }

        std::optional<type_id> simple_type(sparrow::data_type kind)
        {
            using sdt = sparrow::data_type;
            switch (kind)
            {
                // clang-format off
                case sdt::NA:                               return type_id::na;
                case sdt::BOOL:                             return type_id::boolean;
                case sdt::INT8:                             return type_id::int8;
                case sdt::UINT8:                            return type_id::uint8;
                case sdt::INT16:                            return type_id::int16;
                case sdt::UINT16:                           return type_id::uint16;
                case sdt::INT32:                            return type_id::int32;
                case sdt::UINT32:                           return type_id::uint32;
                case sdt::INT64:                            return type_id::int64;
                case sdt::UINT64:                           return type_id::uint64;
                case sdt::HALF_FLOAT:                       return type_id::float16;
                case sdt::FLOAT:                            return type_id::float32;
                case sdt::DOUBLE:                           return type_id::float64;
                case sdt::STRING:                           return type_id::utf8;
                case sdt::BINARY:                           return type_id::binary;
                case sdt::LARGE_STRING:                     return type_id::large_utf8;
                case sdt::LARGE_BINARY:                     return type_id::large_binary;
                case sdt::DATE_DAYS:                        return type_id::date32;
                case sdt::DATE_MILLISECONDS:                return type_id::date64;
                case sdt::INTERVAL_MONTHS:                  return type_id::interval_months;
                case sdt::INTERVAL_DAYS_TIME:               return type_id::interval_day_time;
                case sdt::INTERVAL_MONTHS_DAYS_NANOSECONDS: return type_id::interval_month_day_nano;
                // clang-format on
                default:
                    return std::nullopt;
            }
        }

        data_type decode_leaf(std::string_view format, sparrow::data_type kind)
        {
            using sdt = sparrow::data_type;
            if (const auto id = simple_type(kind); id.has_value())
            {
                parameters_of(format, kind, false);
                return data_type(*id);
            }
            switch (kind)
            {
                // clang-format off
                case sdt::TIME_SECONDS:           parameters_of(format, kind, false); return data_type::time32(time_unit::second);
                case sdt::TIME_MILLISECONDS:      parameters_of(format, kind, false); return data_type::time32(time_unit::milli);
                case sdt::TIME_MICROSECONDS:      parameters_of(format, kind, false); return data_type::time64(time_unit::micro);
                case sdt::TIME_NANOSECONDS:       parameters_of(format, kind, false); return data_type::time64(time_unit::nano);
                case sdt::DURATION_SECONDS:       parameters_of(format, kind, false); return data_type::duration(time_unit::second);
                case sdt::DURATION_MILLISECONDS:  parameters_of(format, kind, false); return data_type::duration(time_unit::milli);
                case sdt::DURATION_MICROSECONDS:  parameters_of(format, kind, false); return data_type::duration(time_unit::micro);
                case sdt::DURATION_NANOSECONDS:   parameters_of(format, kind, false); return data_type::duration(time_unit::nano);
                // clang-format on
                // Timestamps always carry a colon, followed by an optional timezone.
                case sdt::TIMESTAMP_SECONDS:
                    return data_type::timestamp(time_unit::second, std::string(parameters_of(format, kind, true)));
                case sdt::TIMESTAMP_MILLISECONDS:
                    return data_type::timestamp(time_unit::milli, std::string(parameters_of(format, kind, true)));
                case sdt::TIMESTAMP_MICROSECONDS:
                    return data_type::timestamp(time_unit::micro, std::string(parameters_of(format, kind, true)));
                case sdt::TIMESTAMP_NANOSECONDS:
                    return data_type::timestamp(time_unit::nano, std::string(parameters_of(format, kind, true)));
                case sdt::FIXED_WIDTH_BINARY:
                    return data_type::fixed_size_binary(parse_non_negative(format, parameters_of(format, kind, true)));
                case sdt::DECIMAL128:
                case sdt::DECIMAL256:
                    parameters_of(format, kind, true);
                    return decode_decimal(format);
                default:
                    // Decimal32/64, views and run-end encoded arrays have no in-process counterpart.
                    throw_malformed(format);
            }
        }

        data_type
        decode_nested(std::string_view format, sparrow::data_type kind, std::vector<field> children, std::int64_t flags)
        {
            using sdt = sparrow::data_type;
            switch (kind)
            {
                case sdt::LIST:
                case sdt::LARGE_LIST:
                    parameters_of(format, kind, false);
                    expect_children(format, children, 1);
                    return kind == sdt::LIST ? data_type::list(std::move(children[0]))
                                             : data_type::large_list(std::move(children[0]));
                case sdt::STRUCT:
                    parameters_of(format, kind, false);
                    return data_type::struct_(std::move(children));
                case sdt::MAP:
                {
                    parameters_of(format, kind, false);
                    expect_children(format, children, 1);
                    const data_type& entries = children[0].type;
                    if (entries.id() != type_id::struct_ || entries.n_children() != 2)
                    {
                        throw bridge_error(
                            error_kind::child_arity_mismatch,
                            "map entries must be a struct of key and item, got " + to_string(entries)
                        );
                    }
                    return data_type::map(
                        entries.child(0),
                        entries.child(1),
                        has_flag(flags, sparrow::ArrowFlag::MAP_KEYS_SORTED)
                    );
                }
                case sdt::FIXED_SIZED_LIST:
                {
                    const std::int32_t list_size = parse_non_negative(format, parameters_of(format, kind, true));
                    expect_children(format, children, 1);
                    return data_type::fixed_size_list(std::move(children[0]), list_size);
                }
                case sdt::SPARSE_UNION:
                case sdt::DENSE_UNION:
                {
                    parameters_of(format, kind, true);
                    std::vector<std::int8_t> codes = decode_type_codes(format);
                    expect_children(format, children, codes.size());
                    return kind == sdt::SPARSE_UNION ? data_type::sparse_union(std::move(children), std::move(codes))
                                                     : data_type::dense_union(std::move(children), std::move(codes));
                }
                default:
                    throw_malformed(format);
            }
        }
    }

    data_type decode_format(std::string_view format, std::vector<field> children, std::int64_t flags)
    {
        if (format.empty())
        {
            throw_malformed(format);
        }
        const sparrow::data_type kind = recognize(format);
        if (format[0] == '+')
        {
            return decode_nested(format, kind, std::move(children), flags);
        }
        data_type res = decode_leaf(format, kind);
        expect_children(format, children, 0);
        return res;
    }

    std::int64_t encode_flags(const field& f)
    {
        std::int64_t flags = 0;
        if (f.nullable)
        {
            flags |= static_cast<std::int64_t>(sparrow::ArrowFlag::NULLABLE);
        }
        if (f.type.ordered())
        {
            flags |= static_cast<std::int64_t>(sparrow::ArrowFlag::DICTIONARY_ORDERED);
        }
        if (f.type.keys_sorted())
        {
            flags |= static_cast<std::int64_t>(sparrow::ArrowFlag::MAP_KEYS_SORTED);
        }
        return flags;
    }

    bool has_flag(std::int64_t flags, sparrow::ArrowFlag flag) noexcept
    {
        return (flags & static_cast<std::int64_t>(flag)) != 0;
    }
}

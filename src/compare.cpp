#include "cdata_bridge/compare.hpp"

namespace cdata_bridge
{
    namespace
    {
        // Element i of a nested array lives at this index of its children.
        std::int64_t child_index(const array_data& array, std::int64_t i)
        {
            return array.offset() + i;
        }

        bool ranges_equal(
            const array_data& lhs_values,
            std::pair<std::int64_t, std::int64_t> lhs_range,
            const array_data& rhs_values,
            std::pair<std::int64_t, std::int64_t> rhs_range
        )
        {
            const std::int64_t size = lhs_range.second - lhs_range.first;
            if (size != rhs_range.second - rhs_range.first)
            {
                return false;
            }
            for (std::int64_t k = 0; k < size; ++k)
            {
                if (!element_equals(lhs_values, lhs_range.first + k, rhs_values, rhs_range.first + k))
                {
                    return false;
                }
            }
            return true;
        }
    }

    bool element_equals(const array_data& lhs, std::int64_t i, const array_data& rhs, std::int64_t j)
    {
        const bool lhs_null = lhs.is_null(i);
        if (lhs_null != rhs.is_null(j))
        {
            return false;
        }
        if (lhs_null)
        {
            return true;
        }

        const type_id id = lhs.type().id();
        switch (id)
        {
            case type_id::na:
                return true;
            case type_id::boolean:
                return lhs.bool_value(i) == rhs.bool_value(j);
            case type_id::utf8:
            case type_id::binary:
            case type_id::large_utf8:
            case type_id::large_binary:
                return lhs.string_value(i) == rhs.string_value(j);
            case type_id::list:
            case type_id::large_list:
            case type_id::fixed_size_list:
            case type_id::map:
                return ranges_equal(*lhs.child(0), lhs.list_range(i), *rhs.child(0), rhs.list_range(j));
            case type_id::struct_:
                for (std::size_t k = 0; k < lhs.children().size(); ++k)
                {
                    if (!element_equals(*lhs.child(k), child_index(lhs, i), *rhs.child(k), child_index(rhs, j)))
                    {
                        return false;
                    }
                }
                return true;
            case type_id::sparse_union:
            case type_id::dense_union:
            {
                if (lhs.union_type_code(i) != rhs.union_type_code(j))
                {
                    return false;
                }
                const std::size_t k = lhs.union_child_index(i);
                return element_equals(*lhs.child(k), lhs.union_child_offset(i), *rhs.child(k), rhs.union_child_offset(j));
            }
            case type_id::dictionary:
                return element_equals(*lhs.dictionary(), lhs.dictionary_index(i), *rhs.dictionary(), rhs.dictionary_index(j));
            default:
                return lhs.fixed_bytes(i) == rhs.fixed_bytes(j);
        }
    }

    bool array_equals(const array_data& lhs, const array_data& rhs)
    {
        if (!(lhs.type() == rhs.type()) || lhs.length() != rhs.length() || lhs.null_count() != rhs.null_count())
        {
            return false;
        }
        for (std::int64_t i = 0; i < lhs.length(); ++i)
        {
            if (!element_equals(lhs, i, rhs, i))
            {
                return false;
            }
        }
        return true;
    }
}

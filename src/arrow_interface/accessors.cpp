#include "cdata_bridge/arrow_interface/accessors.hpp"

#include <string>

#include "cdata_bridge/bridge_error.hpp"

namespace cdata_bridge
{
    namespace
    {
        void check_alive(const ArrowArray& array)
        {
            if (is_released(array))
            {
                throw bridge_error(error_kind::use_after_release, "ArrowArray has already been released");
            }
        }

        void check_alive(const ArrowSchema& schema)
        {
            if (is_released(schema))
            {
                throw bridge_error(error_kind::released_schema, "ArrowSchema has already been released");
            }
        }

        template <class T>
        T& checked_child(T** children, std::int64_t n_children, std::size_t i)
        {
            if (children == nullptr || i >= static_cast<std::size_t>(n_children) || children[i] == nullptr)
            {
                throw bridge_error(
                    error_kind::structural_mismatch,
                    "child " + std::to_string(i) + " requested from a node with " + std::to_string(n_children)
                        + " children"
                );
            }
            return *children[i];
        }
    }

    bool is_released(const ArrowArray& array) noexcept
    {
        return array.release == nullptr;
    }

    bool is_released(const ArrowSchema& schema) noexcept
    {
        return schema.release == nullptr;
    }

    void mark_released(ArrowArray& array) noexcept
    {
        array.release = nullptr;
    }

    void mark_released(ArrowSchema& schema) noexcept
    {
        schema.release = nullptr;
    }

    ArrowArray move_arrow_array(ArrowArray* source)
    {
        if (source == nullptr)
        {
            throw bridge_error(error_kind::use_after_release, "cannot move from a null ArrowArray");
        }
        check_alive(*source);
        ArrowArray res = *source;
        mark_released(*source);
        return res;
    }

    ArrowSchema move_arrow_schema(ArrowSchema* source)
    {
        if (source == nullptr)
        {
            throw bridge_error(error_kind::released_schema, "cannot move from a null ArrowSchema");
        }
        check_alive(*source);
        ArrowSchema res = *source;
        mark_released(*source);
        return res;
    }

    std::int64_t get_length(const ArrowArray& array)
    {
        check_alive(array);
        return array.length;
    }

    std::int64_t get_null_count(const ArrowArray& array)
    {
        check_alive(array);
        return array.null_count;
    }

    std::int64_t get_offset(const ArrowArray& array)
    {
        check_alive(array);
        return array.offset;
    }

    const void* get_buffer(const ArrowArray& array, std::size_t i)
    {
        check_alive(array);
        if (array.buffers == nullptr || i >= static_cast<std::size_t>(array.n_buffers))
        {
            throw bridge_error(
                error_kind::structural_mismatch,
                "buffer " + std::to_string(i) + " requested from an array with " + std::to_string(array.n_buffers)
                    + " buffers"
            );
        }
        return array.buffers[i];
    }

    const ArrowArray& get_child(const ArrowArray& array, std::size_t i)
    {
        check_alive(array);
        return checked_child(array.children, array.n_children, i);
    }

    const ArrowArray* get_dictionary(const ArrowArray& array)
    {
        check_alive(array);
        return array.dictionary;
    }

    std::string_view get_format(const ArrowSchema& schema)
    {
        check_alive(schema);
        return schema.format == nullptr ? std::string_view{} : std::string_view{schema.format};
    }

    std::string_view get_name(const ArrowSchema& schema)
    {
        check_alive(schema);
        return schema.name == nullptr ? std::string_view{} : std::string_view{schema.name};
    }

    std::int64_t get_flags(const ArrowSchema& schema)
    {
        check_alive(schema);
        return schema.flags;
    }

    const ArrowSchema& get_schema_child(const ArrowSchema& schema, std::size_t i)
    {
        check_alive(schema);
        return checked_child(schema.children, schema.n_children, i);
    }
}

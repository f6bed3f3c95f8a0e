#include "cdata_bridge/bridge.hpp"

#include <string>

#include "cdata_bridge/array_builders.hpp"
#include "cdata_bridge/arrow_interface/accessors.hpp"
#include "cdata_bridge/arrow_interface/arrow_array_schema_common_release.hpp"
#include "cdata_bridge/bridge_error.hpp"
#include "cdata_bridge/export_array.hpp"
#include "cdata_bridge/export_schema.hpp"
#include "cdata_bridge/import_array.hpp"
#include "cdata_bridge/import_schema.hpp"

namespace cdata_bridge
{
    c_data_pair::c_data_pair() noexcept = default;

    c_data_pair::c_data_pair(ArrowSchema&& schema, ArrowArray&& array) noexcept
        : m_schema(schema)
        , m_array(array)
    {
        mark_released(schema);
        mark_released(array);
    }

    c_data_pair::~c_data_pair()
    {
        release();
    }

    c_data_pair::c_data_pair(c_data_pair&& rhs) noexcept
        : m_schema(rhs.m_schema)
        , m_array(rhs.m_array)
    {
        mark_released(rhs.m_schema);
        mark_released(rhs.m_array);
    }

    c_data_pair& c_data_pair::operator=(c_data_pair&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            m_schema = rhs.m_schema;
            m_array = rhs.m_array;
            mark_released(rhs.m_schema);
            mark_released(rhs.m_array);
        }
        return *this;
    }

    ArrowSchema& c_data_pair::schema()
    {
        if (cdata_bridge::is_released(m_schema))
        {
            throw bridge_error(error_kind::released_schema, "c_data_pair schema has already been released");
        }
        return m_schema;
    }

    const ArrowSchema& c_data_pair::schema() const
    {
        return const_cast<c_data_pair*>(this)->schema();
    }

    ArrowArray& c_data_pair::array()
    {
        if (cdata_bridge::is_released(m_array))
        {
            throw bridge_error(error_kind::use_after_release, "c_data_pair array has already been released");
        }
        return m_array;
    }

    const ArrowArray& c_data_pair::array() const
    {
        return const_cast<c_data_pair*>(this)->array();
    }

    bool c_data_pair::is_released() const noexcept
    {
        return cdata_bridge::is_released(m_schema) && cdata_bridge::is_released(m_array);
    }

    void c_data_pair::release() noexcept
    {
        release_if_alive(&m_array);
        release_if_alive(&m_schema);
        mark_released(m_array);
        mark_released(m_schema);
    }

    std::pair<ArrowArray, ArrowSchema> c_data_pair::extract()
    {
        ArrowSchema* c_schema = &schema();
        ArrowArray* c_array = &array();
        return {move_arrow_array(c_array), move_arrow_schema(c_schema)};
    }

    array_ptr c_data_pair::to_array(const import_options& options)
    {
        return try_from(&schema(), &array(), options);
    }

    c_data_pair export_to_c(const array_ptr& array, const field& f)
    {
        if (array == nullptr)
        {
            throw bridge_error(error_kind::structural_mismatch, "cannot export a null array");
        }
        if (!(array->type() == f.type))
        {
            throw bridge_error(
                error_kind::structural_mismatch,
                "field '" + f.name + "' of type " + to_string(f.type) + " describes an array of type "
                    + to_string(array->type())
            );
        }
        ArrowSchema schema{};
        export_field(f, &schema);
        ArrowArray c_array{};
        try
        {
            export_array(array, &c_array);
        }
        catch (...)
        {
            release_if_alive(&schema);
            throw;
        }
        return c_data_pair(std::move(schema), std::move(c_array));
    }

    c_data_pair export_to_c(const array_ptr& array, std::string_view name, bool nullable)
    {
        if (array == nullptr)
        {
            throw bridge_error(error_kind::structural_mismatch, "cannot export a null array");
        }
        return export_to_c(array, field(std::string(name), array->type(), nullable));
    }

    imported_field import_field_and_array(ArrowSchema* schema, ArrowArray* array, const import_options& options)
    {
        if (schema == nullptr)
        {
            throw bridge_error(error_kind::released_schema, "null ArrowSchema");
        }
        field f = decode_schema(*schema, options);
        array_ptr imported = import_array(array, f.type, options);
        schema->release(schema);
        mark_released(*schema);
        return {std::move(f), std::move(imported)};
    }

    array_ptr try_from(ArrowSchema* schema, ArrowArray* array, const import_options& options)
    {
        return import_field_and_array(schema, array, options).array;
    }

    c_data_pair create_empty(const data_type& type)
    {
        return export_to_c(make_empty_array(type));
    }
}

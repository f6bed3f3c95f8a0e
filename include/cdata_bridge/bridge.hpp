#pragma once

#include <string_view>
#include <utility>

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/array_data.hpp"
#include "cdata_bridge/config/config.hpp"
#include "cdata_bridge/data_type.hpp"
#include "cdata_bridge/import_options.hpp"

namespace cdata_bridge
{
    /**
     * @brief Owner of an `ArrowSchema` and `ArrowArray` pair.
     *
     * Releases both structures on destruction unless they were handed out with
     * extract() or consumed with to_array(). The pair is move-only.
     */
    class CDATA_BRIDGE_API c_data_pair
    {
    public:

        // Builds an already released pair.
        c_data_pair() noexcept;

        // Takes over the release responsibility of both structures.
        c_data_pair(ArrowSchema&& schema, ArrowArray&& array) noexcept;

        ~c_data_pair();

        c_data_pair(const c_data_pair&) = delete;
        c_data_pair& operator=(const c_data_pair&) = delete;
        c_data_pair(c_data_pair&& rhs) noexcept;
        c_data_pair& operator=(c_data_pair&& rhs) noexcept;

        /**
         * @throws bridge_error with error_kind::released_schema once the schema
         *         has been released, extracted or consumed.
         */
        [[nodiscard]] ArrowSchema& schema();
        [[nodiscard]] const ArrowSchema& schema() const;

        /**
         * @throws bridge_error with error_kind::use_after_release once the array
         *         has been released, extracted or consumed.
         */
        [[nodiscard]] ArrowArray& array();
        [[nodiscard]] const ArrowArray& array() const;

        [[nodiscard]] bool is_released() const noexcept;

        // Releases both structures. Calling it again does nothing.
        void release() noexcept;

        /**
         * @brief Hands both structures out. The caller becomes responsible for
         * releasing them.
         */
        [[nodiscard]] std::pair<ArrowArray, ArrowSchema> extract();

        /**
         * @brief Imports the pair, see try_from.
         */
        [[nodiscard]] array_ptr to_array(const import_options& options = {});

    private:

        ArrowSchema m_schema{};
        ArrowArray m_array{};
    };

    /**
     * @brief Exports an array together with the schema of a field describing it.
     *
     * The field type must be the array type.
     *
     * @throws bridge_error with error_kind::unsupported_type or
     *         error_kind::structural_mismatch. Nothing is exported on failure.
     */
    [[nodiscard]] CDATA_BRIDGE_API c_data_pair export_to_c(const array_ptr& array, const field& f);

    [[nodiscard]] CDATA_BRIDGE_API c_data_pair
    export_to_c(const array_ptr& array, std::string_view name = "", bool nullable = true);

    /**
     * @brief Imports a schema and array pair.
     *
     * On success the array is owned by the returned tree (see import_array) and
     * the schema is released. On failure neither structure is released and the
     * caller keeps both.
     */
    [[nodiscard]] CDATA_BRIDGE_API array_ptr
    try_from(ArrowSchema* schema, ArrowArray* array, const import_options& options = {});

    struct imported_field
    {
        field schema;
        array_ptr array;
    };

    /**
     * @brief Same as try_from, but also returns the decoded field with its name,
     * nullability and metadata.
     */
    [[nodiscard]] CDATA_BRIDGE_API imported_field
    import_field_and_array(ArrowSchema* schema, ArrowArray* array, const import_options& options = {});

    /**
     * @brief Exports a structurally valid zero-length array of @p type.
     */
    [[nodiscard]] CDATA_BRIDGE_API c_data_pair create_empty(const data_type& type);
}

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * @brief Categories of failures raised while crossing the C Data Interface boundary.
     */
    enum class error_kind
    {
        unsupported_type,               ///< The logical type has no format token.
        malformed_format_string,        ///< A received format token cannot be parsed.
        child_arity_mismatch,           ///< The format token implies another number of children.
        structural_mismatch,            ///< Buffer, child or dictionary layout disagrees with the type.
        invalid_schema,                 ///< Inconsistent flags, metadata or child pointers.
        released_schema,                ///< The ArrowSchema has already been released.
        use_after_release,              ///< The ArrowArray has already been released.
        alignment_or_bounds_violation   ///< A buffer is misaligned or too small for the declared extent.
    };

    [[nodiscard]] CDATA_BRIDGE_API std::string_view to_string(error_kind kind) noexcept;

    /**
     * @brief Exception thrown by every export and import operation.
     *
     * The exception is thrown before any release callback is invoked: when an
     * import fails, the caller still owns the structures it passed in.
     */
    class CDATA_BRIDGE_API bridge_error : public std::runtime_error
    {
    public:

        bridge_error(error_kind kind, const std::string& message);

        [[nodiscard]] error_kind kind() const noexcept;

    private:

        error_kind m_kind;
    };
}

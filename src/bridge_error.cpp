#include "cdata_bridge/bridge_error.hpp"

namespace cdata_bridge
{
    std::string_view to_string(error_kind kind) noexcept
    {
        switch (kind)
        {
            case error_kind::unsupported_type:
                return "unsupported type";
            case error_kind::malformed_format_string:
                return "malformed format string";
            case error_kind::child_arity_mismatch:
                return "child arity mismatch";
            case error_kind::structural_mismatch:
                return "structural mismatch";
            case error_kind::invalid_schema:
                return "invalid schema";
            case error_kind::released_schema:
                return "released schema";
            case error_kind::use_after_release:
                return "use after release";
            case error_kind::alignment_or_bounds_violation:
                return "alignment or bounds violation";
        }
        return "unknown error";
    }

    bridge_error::bridge_error(error_kind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , m_kind(kind)
    {
    }

    error_kind bridge_error::kind() const noexcept
    {
        return m_kind;
    }
}

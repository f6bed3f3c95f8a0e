#pragma once

#include <sparrow/c_interface.hpp>

#include "cdata_bridge/arrow_interface/ownership_token.hpp"
#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * @brief Owner of an `ArrowArray` received from a foreign producer.
     *
     * The handle takes the structure by move and invokes its release callback
     * exactly once: on the first call to release() or on destruction, whichever
     * comes first. Every buffer of an imported array holds a shared reference on
     * the handle, so the foreign memory stays valid until the last of them drops.
     */
    class CDATA_BRIDGE_API imported_array_handle : public ownership_token
    {
    public:

        static constexpr token_tag token_kind = token_tag::imported_array;

        explicit imported_array_handle(ArrowArray&& array) noexcept;
        ~imported_array_handle();

        [[nodiscard]] const ArrowArray& array() const noexcept;

        void release() noexcept;

    private:

        ArrowArray m_array;
    };
}

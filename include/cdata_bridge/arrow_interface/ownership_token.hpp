#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>

#include "cdata_bridge/config/config.hpp"

namespace cdata_bridge
{
    /**
     * Identifies the kind of private data attached to an exported or imported
     * C structure.
     */
    enum class token_tag : std::uint64_t
    {
        arrow_schema = 0x4344425f53434845,    // "CDB_SCHE"
        arrow_array = 0x4344425f41525241,     // "CDB_ARRA"
        imported_array = 0x4344425f494d5054,  // "CDB_IMPT"
        tombstone = 0xdeaddeaddeaddead
    };

    /**
     * @brief Base of every private data object owned by this library.
     *
     * The token carries the tag of the private data kind and a live/released
     * state. Release callbacks compare the tag before downcasting, and move the
     * state to released exactly once. The tag is overwritten with
     * token_tag::tombstone on destruction.
     *
     * Private data is always stored in the C structures as a pointer to this
     * base, so that the tag can be read from any private data of ours.
     */
    class CDATA_BRIDGE_API ownership_token
    {
    public:

        explicit ownership_token(token_tag tag) noexcept;
        ~ownership_token();

        ownership_token(const ownership_token&) = delete;
        ownership_token& operator=(const ownership_token&) = delete;
        ownership_token(ownership_token&&) = delete;
        ownership_token& operator=(ownership_token&&) = delete;

        [[nodiscard]] token_tag tag() const noexcept;
        [[nodiscard]] bool is_released() const noexcept;

        // Moves the token to the released state. Returns false if it was already released.
        [[nodiscard]] bool try_release() noexcept;

    private:

        token_tag m_tag;
        std::atomic<bool> m_released{false};
    };

    /**
     * @brief Returns the private data of kind T, or nullptr when private_data is
     * null or carries another tag.
     */
    template <class T>
        requires std::derived_from<T, ownership_token>
    [[nodiscard]] T* as_private_data(void* private_data) noexcept
    {
        if (private_data == nullptr)
        {
            return nullptr;
        }
        auto* token = static_cast<ownership_token*>(private_data);
        if (token->tag() != T::token_kind)
        {
            return nullptr;
        }
        return static_cast<T*>(token);
    }

    // Pointer to store in the private_data member of a C structure.
    [[nodiscard]] inline void* to_private_data(ownership_token* token) noexcept
    {
        return static_cast<void*>(token);
    }
}

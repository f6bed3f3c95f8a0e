#include "cdata_bridge/arrow_interface/ownership_token.hpp"

namespace cdata_bridge
{
    ownership_token::ownership_token(token_tag tag) noexcept
        : m_tag(tag)
    {
    }

    ownership_token::~ownership_token()
    {
        m_tag = token_tag::tombstone;
    }

    token_tag ownership_token::tag() const noexcept
    {
        return m_tag;
    }

    bool ownership_token::is_released() const noexcept
    {
        return m_released.load(std::memory_order_acquire);
    }

    bool ownership_token::try_release() noexcept
    {
        return !m_released.exchange(true, std::memory_order_acq_rel);
    }
}

#include "cdata_bridge/arrow_interface/imported_array_handle.hpp"

namespace cdata_bridge
{
    imported_array_handle::imported_array_handle(ArrowArray&& array) noexcept
        : ownership_token(token_kind)
        , m_array(array)
    {
        array.release = nullptr;
    }

    imported_array_handle::~imported_array_handle()
    {
        release();
    }

    const ArrowArray& imported_array_handle::array() const noexcept
    {
        return m_array;
    }

    void imported_array_handle::release() noexcept
    {
        if (try_release() && m_array.release != nullptr)
        {
            m_array.release(&m_array);
            m_array.release = nullptr;
        }
    }
}

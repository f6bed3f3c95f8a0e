#pragma once

namespace cdata_bridge
{
    constexpr int CDATA_BRIDGE_VERSION_MAJOR = 0;
    constexpr int CDATA_BRIDGE_VERSION_MINOR = 1;
    constexpr int CDATA_BRIDGE_VERSION_PATCH = 0;

    constexpr int CDATA_BRIDGE_BINARY_CURRENT = 1;
    constexpr int CDATA_BRIDGE_BINARY_REVISION = 0;
    constexpr int CDATA_BRIDGE_BINARY_AGE = 0;

    static_assert(
        CDATA_BRIDGE_BINARY_AGE <= CDATA_BRIDGE_BINARY_CURRENT,
        "CDATA_BRIDGE_BINARY_AGE cannot be greater than CDATA_BRIDGE_BINARY_CURRENT"
    );
}

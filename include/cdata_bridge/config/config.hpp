#pragma once

#if defined(_WIN32)
#    if defined(CDATA_BRIDGE_STATIC_LIB)
#        define CDATA_BRIDGE_API
#    elif defined(CDATA_BRIDGE_EXPORTS)
#        define CDATA_BRIDGE_API __declspec(dllexport)
#    else
#        define CDATA_BRIDGE_API __declspec(dllimport)
#    endif
#else
#    define CDATA_BRIDGE_API __attribute__((visibility("default")))
#endif

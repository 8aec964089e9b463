#pragma once

#if defined(_WIN32)
    #if defined(SNAPI_STATESYNC_BUILD_DLL)
        #define SNAPI_STATESYNC_API __declspec(dllexport)
    #elif defined(SNAPI_STATESYNC_USE_DLL)
        #define SNAPI_STATESYNC_API __declspec(dllimport)
    #else
        #define SNAPI_STATESYNC_API
    #endif
#else
    #if defined(__GNUC__) || defined(__clang__)
        #define SNAPI_STATESYNC_API __attribute__((visibility("default")))
    #else
        #define SNAPI_STATESYNC_API
    #endif
#endif

/** @brief Library version, bumped with every released API change. */
#define SNAPI_STATESYNC_VERSION_MAJOR 0
#define SNAPI_STATESYNC_VERSION_MINOR 1
#define SNAPI_STATESYNC_VERSION_PATCH 0

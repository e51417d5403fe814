#pragma once

// =============================================================================
// Platform detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifndef CLUSTERMC_PLATFORM_WINDOWS
        #define CLUSTERMC_PLATFORM_WINDOWS
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #ifndef CLUSTERMC_PLATFORM_MACOS
        #define CLUSTERMC_PLATFORM_MACOS
    #endif
#elif defined(__linux__)
    #ifndef CLUSTERMC_PLATFORM_LINUX
        #define CLUSTERMC_PLATFORM_LINUX
    #endif
#endif

#if defined(CLUSTERMC_PLATFORM_LINUX) || defined(CLUSTERMC_PLATFORM_MACOS)
    #ifndef CLUSTERMC_PLATFORM_POSIX
        #define CLUSTERMC_PLATFORM_POSIX
    #endif
#endif

// =============================================================================
// TLS support
// =============================================================================

// CLUSTERMC_HAS_SSL is injected by CMakeLists.txt (target_compile_definitions)
// when OpenSSL is found and CLUSTERMC_ENABLE_SSL=ON. It gates TLS for both
// the configuration endpoint and the cache nodes.

// =============================================================================
// Protocol defaults
// =============================================================================

// Default memcached port, also the usual configuration endpoint port
#define CLUSTERMC_DEFAULT_PORT 11211

// =============================================================================
// Platform-specific headers
// =============================================================================

#ifdef CLUSTERMC_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

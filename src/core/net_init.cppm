module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <WinSock2.h>
#endif

export module clustermc.core.net_init;

import std;
import clustermc.core.error;

namespace clustermc {

// =============================================================================
// Socket library start-up
// =============================================================================

/// Starts the platform socket library once per process (WSAStartup on
/// Windows, nothing on POSIX). socket::create and resolve call it, so
/// callers never need to. The result of the first call is remembered;
/// the library stays up until process exit.
export inline auto ensure_network() -> std::expected<void, std::error_code> {
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    static const int rc = [] {
        WSADATA wsa{};
        return ::WSAStartup(MAKEWORD(2, 2), &wsa);
    }();
    if (rc != 0)
        return std::unexpected(make_error_code(from_native_error(rc)));
#endif
    return {};
}

} // namespace clustermc

/// clustermc.core.dns: blocking name resolution
/// getaddrinfo on the calling thread; clustermc has no event loop to offload to

module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#include <WinSock2.h>
#include <WS2tcpip.h>
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#endif

export module clustermc.core.dns;

import std;
import clustermc.core.error;
import clustermc.core.address;
import clustermc.core.net_init;

namespace clustermc {

namespace detail {

inline auto map_gai_error(int rc) noexcept -> std::error_code {
    if (rc == EAI_AGAIN)
        return make_error_code(errc::host_unreachable);
    if (rc == EAI_MEMORY)
        return make_error_code(errc::out_of_memory);
    // EAI_NONAME, EAI_FAIL and the platform-specific rest
    return make_error_code(errc::host_not_found);
}

} // namespace detail

// =============================================================================
// resolve
// =============================================================================

/// Resolve host to a list of addresses, in resolver order (IPv4/IPv6 mixed).
/// IP literals are returned without a lookup.
/// Lookup failures map to errc::host_not_found (or host_unreachable for
/// a temporary resolver failure).
export inline auto resolve(std::string_view host)
    -> std::expected<std::vector<ip_address>, std::error_code>
{
    if (auto literal = ip_address::parse(host))
        return std::vector<ip_address>{*literal};

    if (auto up = ensure_network(); !up)
        return std::unexpected(up.error());

    ::addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    ::addrinfo* res = nullptr;
    std::string h(host);
    int rc = ::getaddrinfo(h.c_str(), nullptr, &hints, &res);
    if (rc != 0)
        return std::unexpected(detail::map_gai_error(rc));
    if (!res)
        return std::unexpected(make_error_code(errc::host_not_found));

    std::vector<ip_address> addrs;
    for (auto* p = res; p; p = p->ai_next) {
        if (p->ai_family == AF_INET) {
            auto* sa = reinterpret_cast<const ::sockaddr_in*>(p->ai_addr);
            addrs.emplace_back(ip_address::from_native(sa->sin_addr));
        } else if (p->ai_family == AF_INET6) {
            auto* sa = reinterpret_cast<const ::sockaddr_in6*>(p->ai_addr);
            addrs.emplace_back(ip_address::from_native(sa->sin6_addr));
        }
    }
    ::freeaddrinfo(res);

    if (addrs.empty())
        return std::unexpected(make_error_code(errc::host_not_found));
    return addrs;
}

} // namespace clustermc

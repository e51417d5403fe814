module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#include <WinSock2.h>
#include <WS2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#endif

export module clustermc.core.address;

import std;

namespace clustermc {

// =============================================================================
// ip_address
// =============================================================================

export enum class address_family {
    ipv4,
    ipv6,
};

/// An IPv4 or IPv6 address in network byte order, as handed to and
/// returned by the socket calls.
export class ip_address {
public:
    ip_address() noexcept : addr_(::in_addr{}) {}

    [[nodiscard]] static auto from_native(const ::in_addr& a) noexcept -> ip_address {
        return ip_address{a};
    }

    [[nodiscard]] static auto from_native(const ::in6_addr& a) noexcept -> ip_address {
        return ip_address{a};
    }

    /// Dotted quad or IPv6 literal; nullopt for anything else (host names)
    [[nodiscard]] static auto parse(std::string_view literal) -> std::optional<ip_address> {
        std::string s(literal);
        ::in_addr v4{};
        if (::inet_pton(AF_INET, s.c_str(), &v4) == 1)
            return ip_address{v4};
        ::in6_addr v6{};
        if (::inet_pton(AF_INET6, s.c_str(), &v6) == 1)
            return ip_address{v6};
        return std::nullopt;
    }

    /// 127.0.0.1
    [[nodiscard]] static auto loopback_v4() noexcept -> ip_address {
        ::in_addr a{};
        a.s_addr = htonl(INADDR_LOOPBACK);
        return ip_address{a};
    }

    [[nodiscard]] auto family() const noexcept -> address_family {
        return std::holds_alternative<::in_addr>(addr_) ? address_family::ipv4
                                                         : address_family::ipv6;
    }

    [[nodiscard]] auto is_v4() const noexcept -> bool { return family() == address_family::ipv4; }

    /// Only valid for the matching family
    [[nodiscard]] auto v4() const -> const ::in_addr& { return std::get<::in_addr>(addr_); }
    [[nodiscard]] auto v6() const -> const ::in6_addr& { return std::get<::in6_addr>(addr_); }

private:
    explicit ip_address(const ::in_addr& a) noexcept : addr_(a) {}
    explicit ip_address(const ::in6_addr& a) noexcept : addr_(a) {}

    std::variant<::in_addr, ::in6_addr> addr_;
};

/// Address and port of a socket
export struct endpoint {
    ip_address    address;
    std::uint16_t port = 0;
};

} // namespace clustermc

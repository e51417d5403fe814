module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <WinSock2.h>
#include <WS2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif

module clustermc.core.socket;

import clustermc.core.error;
import clustermc.core.net_init;

namespace clustermc {

namespace {

auto to_native_family(address_family family) noexcept -> int {
    return family == address_family::ipv4 ? AF_INET : AF_INET6;
}

auto last_error() noexcept -> int {
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    return ::WSAGetLastError();
#else
    return errno;
#endif
}

auto last_error_code() noexcept -> std::error_code {
    return make_error_code(from_native_error(last_error()));
}

auto fill_sockaddr(const endpoint& ep, ::sockaddr_storage& storage) noexcept -> int {
    std::memset(&storage, 0, sizeof(storage));
    if (ep.address.is_v4()) {
        auto& sa = reinterpret_cast<::sockaddr_in&>(storage);
        sa.sin_family = AF_INET;
        sa.sin_port = htons(ep.port);
        sa.sin_addr = ep.address.v4();
        return static_cast<int>(sizeof(::sockaddr_in));
    } else {
        auto& sa = reinterpret_cast<::sockaddr_in6&>(storage);
        sa.sin6_family = AF_INET6;
        sa.sin6_port = htons(ep.port);
        sa.sin6_addr = ep.address.v6();
        return static_cast<int>(sizeof(::sockaddr_in6));
    }
}

auto would_block(int err) noexcept -> bool {
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
    return err == EWOULDBLOCK || err == EAGAIN || err == EINPROGRESS;
#endif
}

auto interrupted([[maybe_unused]] int err) noexcept -> bool {
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    return false;
#else
    return err == EINTR;
#endif
}

/// Waits until handle is readable (POLLIN) or writable (POLLOUT)
auto wait_ready(native_handle_t handle, short events,
                std::chrono::steady_clock::time_point deadline)
    -> std::expected<void, std::error_code>
{
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
            return std::unexpected(make_error_code(errc::connection_timed_out));

#ifdef CLUSTERMC_PLATFORM_WINDOWS
        WSAPOLLFD pfd{};
        pfd.fd = handle;
        pfd.events = events;
        int rc = ::WSAPoll(&pfd, 1, static_cast<INT>(left.count()));
#else
        ::pollfd pfd{};
        pfd.fd = handle;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
#endif
        if (rc > 0) return {};
        if (rc == 0)
            return std::unexpected(make_error_code(errc::connection_timed_out));
        if (!interrupted(last_error()))
            return std::unexpected(last_error_code());
    }
}

} // anonymous namespace

// =============================================================================
// Lifetime
// =============================================================================

socket::~socket() {
    close();
}

socket::socket(socket&& other) noexcept : handle_(other.handle_) {
    other.handle_ = invalid_handle;
}

auto socket::operator=(socket&& other) noexcept -> socket& {
    if (this != &other) {
        close();
        handle_ = other.handle_;
        other.handle_ = invalid_handle;
    }
    return *this;
}

auto socket::create(address_family family)
    -> std::expected<socket, std::error_code>
{
    if (auto up = ensure_network(); !up)
        return std::unexpected(up.error());

    auto fd = ::socket(to_native_family(family), SOCK_STREAM, IPPROTO_TCP);
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    if (fd == INVALID_SOCKET)
        return std::unexpected(last_error_code());
#else
    if (fd < 0)
        return std::unexpected(last_error_code());
#endif

#if defined(SO_NOSIGPIPE)
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    return socket{fd};
}

// =============================================================================
// bind / listen
// =============================================================================

auto socket::bind(const endpoint& ep) -> std::expected<void, std::error_code> {
    ::sockaddr_storage storage{};
    int len = fill_sockaddr(ep, storage);

    if (::bind(handle_, reinterpret_cast<const ::sockaddr*>(&storage), len) != 0)
        return std::unexpected(last_error_code());

    return {};
}

auto socket::listen(int backlog) -> std::expected<void, std::error_code> {
    if (::listen(handle_, backlog) != 0)
        return std::unexpected(last_error_code());
    return {};
}

// =============================================================================
// Options
// =============================================================================

auto socket::set_non_blocking(bool enabled) -> std::expected<void, std::error_code> {
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    u_long mode = enabled ? 1 : 0;
    if (::ioctlsocket(handle_, FIONBIO, &mode) != 0)
        return std::unexpected(last_error_code());
#else
    int flags = ::fcntl(handle_, F_GETFL, 0);
    if (flags < 0)
        return std::unexpected(last_error_code());
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(handle_, F_SETFL, flags) < 0)
        return std::unexpected(last_error_code());
#endif
    return {};
}

auto socket::apply_options(const socket_options& opts)
    -> std::expected<void, std::error_code>
{
    if (opts.reuse_address) {
        int val = 1;
        if (::setsockopt(handle_, SOL_SOCKET, SO_REUSEADDR,
                         reinterpret_cast<const char*>(&val), sizeof(val)) != 0)
            return std::unexpected(last_error_code());
    }

    if (opts.no_delay) {
        int val = 1;
        if (::setsockopt(handle_, IPPROTO_TCP, TCP_NODELAY,
                         reinterpret_cast<const char*>(&val), sizeof(val)) != 0)
            return std::unexpected(last_error_code());
    }

    return {};
}

// =============================================================================
// Blocking operations
// =============================================================================

auto socket::connect(const endpoint& ep, std::chrono::milliseconds timeout)
    -> std::expected<void, std::error_code>
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    if (auto r = set_non_blocking(true); !r) return r;

    ::sockaddr_storage storage{};
    int len = fill_sockaddr(ep, storage);

    if (::connect(handle_, reinterpret_cast<const ::sockaddr*>(&storage), len) == 0)
        return {};

    int err = last_error();
    if (!would_block(err))
        return std::unexpected(make_error_code(from_native_error(err)));

    if (auto w = wait_ready(handle_, POLLOUT, deadline); !w)
        return w;

    // Connection outcome is reported through SO_ERROR
    int so_error = 0;
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    int so_len = sizeof(so_error);
#else
    ::socklen_t so_len = sizeof(so_error);
#endif
    if (::getsockopt(handle_, SOL_SOCKET, SO_ERROR,
                     reinterpret_cast<char*>(&so_error), &so_len) != 0)
        return std::unexpected(last_error_code());
    if (so_error != 0)
        return std::unexpected(make_error_code(from_native_error(so_error)));
    return {};
}

auto socket::send_all(const_buffer buf, std::chrono::milliseconds timeout)
    -> std::expected<void, std::error_code>
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
#ifdef MSG_NOSIGNAL
    constexpr int flags = MSG_NOSIGNAL;
#else
    constexpr int flags = 0;
#endif

    while (buf.size > 0) {
        auto n = ::send(handle_, static_cast<const char*>(buf.data),
                        static_cast<int>(buf.size), flags);
        if (n > 0) {
            buf = buf.advanced(static_cast<std::size_t>(n));
            continue;
        }
        int err = last_error();
        if (n < 0 && interrupted(err)) continue;
        if (n < 0 && would_block(err)) {
            if (auto w = wait_ready(handle_, POLLOUT, deadline); !w)
                return w;
            continue;
        }
        return std::unexpected(make_error_code(from_native_error(err)));
    }
    return {};
}

auto socket::receive(mutable_buffer buf, std::chrono::milliseconds timeout)
    -> std::expected<std::size_t, std::error_code>
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto n = ::recv(handle_, static_cast<char*>(buf.data),
                        static_cast<int>(buf.size), 0);
        if (n >= 0)
            return static_cast<std::size_t>(n);

        int err = last_error();
        if (interrupted(err)) continue;
        if (!would_block(err))
            return std::unexpected(make_error_code(from_native_error(err)));
        if (auto w = wait_ready(handle_, POLLIN, deadline); !w)
            return std::unexpected(w.error());
    }
}

auto socket::accept(std::chrono::milliseconds timeout)
    -> std::expected<socket, std::error_code>
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    if (auto r = set_non_blocking(true); !r)
        return std::unexpected(r.error());

    for (;;) {
        auto fd = ::accept(handle_, nullptr, nullptr);
        if (fd != invalid_handle
#ifndef CLUSTERMC_PLATFORM_WINDOWS
            && fd >= 0
#endif
        ) {
            socket peer{fd};
            if (auto r = peer.set_non_blocking(true); !r)
                return std::unexpected(r.error());
            return peer;
        }

        int err = last_error();
        if (interrupted(err)) continue;
        if (!would_block(err))
            return std::unexpected(make_error_code(from_native_error(err)));
        if (auto w = wait_ready(handle_, POLLIN, deadline); !w)
            return std::unexpected(w.error());
    }
}

auto socket::local_endpoint() const -> std::expected<endpoint, std::error_code> {
    ::sockaddr_storage storage{};
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    int len = sizeof(storage);
#else
    ::socklen_t len = sizeof(storage);
#endif
    if (::getsockname(handle_, reinterpret_cast<::sockaddr*>(&storage), &len) != 0)
        return std::unexpected(last_error_code());

    if (storage.ss_family == AF_INET) {
        auto& sa = reinterpret_cast<const ::sockaddr_in&>(storage);
        return endpoint{ip_address::from_native(sa.sin_addr), ntohs(sa.sin_port)};
    }
    auto& sa6 = reinterpret_cast<const ::sockaddr_in6&>(storage);
    return endpoint{ip_address::from_native(sa6.sin6_addr), ntohs(sa6.sin6_port)};
}

void socket::close() noexcept {
    if (handle_ == invalid_handle) return;
#ifdef CLUSTERMC_PLATFORM_WINDOWS
    ::closesocket(handle_);
#else
    ::close(handle_);
#endif
    handle_ = invalid_handle;
}

} // namespace clustermc

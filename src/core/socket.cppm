module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#include <WinSock2.h>
#include <WS2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#endif

export module clustermc.core.socket;

import std;
import clustermc.core.error;
import clustermc.core.buffer;
import clustermc.core.address;

namespace clustermc {

// =============================================================================
// Platform aliases
// =============================================================================

#ifdef CLUSTERMC_PLATFORM_WINDOWS
export using native_handle_t = SOCKET;
export inline constexpr native_handle_t invalid_handle = INVALID_SOCKET;
#else
export using native_handle_t = int;
export inline constexpr native_handle_t invalid_handle = -1;
#endif

export struct socket_options {
    bool reuse_address = false;
    bool no_delay = false;        // TCP_NODELAY
};

// =============================================================================
// socket
// =============================================================================

/// Owns a native TCP socket handle (RAII).
///
/// The blocking helpers (connect / send_all / receive / accept) keep the
/// handle in non-blocking mode and wait with poll(), so every call is
/// bounded by its timeout. Expiry is reported as errc::connection_timed_out.
export class socket {
public:
    socket() noexcept = default;
    ~socket();

    socket(const socket&) = delete;
    auto operator=(const socket&) -> socket& = delete;

    socket(socket&& other) noexcept;
    auto operator=(socket&& other) noexcept -> socket&;

    /// Starts the socket library on first use (ensure_network)
    [[nodiscard]] static auto create(address_family family)
        -> std::expected<socket, std::error_code>;

    [[nodiscard]] auto bind(const endpoint& ep) -> std::expected<void, std::error_code>;

    [[nodiscard]] auto listen(int backlog = 128) -> std::expected<void, std::error_code>;

    [[nodiscard]] auto set_non_blocking(bool enabled) -> std::expected<void, std::error_code>;

    [[nodiscard]] auto apply_options(const socket_options& opts) -> std::expected<void, std::error_code>;

    // ----- Blocking operations with deadline -----

    [[nodiscard]] auto connect(const endpoint& ep, std::chrono::milliseconds timeout)
        -> std::expected<void, std::error_code>;

    /// Writes the whole buffer or fails
    [[nodiscard]] auto send_all(const_buffer buf, std::chrono::milliseconds timeout)
        -> std::expected<void, std::error_code>;

    /// Reads at least one byte. 0 means the peer closed the connection.
    [[nodiscard]] auto receive(mutable_buffer buf, std::chrono::milliseconds timeout)
        -> std::expected<std::size_t, std::error_code>;

    [[nodiscard]] auto accept(std::chrono::milliseconds timeout)
        -> std::expected<socket, std::error_code>;

    /// Bound address (useful after binding to port 0)
    [[nodiscard]] auto local_endpoint() const -> std::expected<endpoint, std::error_code>;

    void close() noexcept;

    [[nodiscard]] auto is_open() const noexcept -> bool {
        return handle_ != invalid_handle;
    }

    explicit operator bool() const noexcept { return is_open(); }

private:
    explicit socket(native_handle_t handle) noexcept : handle_(handle) {}

    native_handle_t handle_ = invalid_handle;
};

} // namespace clustermc

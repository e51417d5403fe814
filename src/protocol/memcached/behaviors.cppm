module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:behaviors;

import std;
import clustermc.core.error;
import clustermc.core.log;

namespace clustermc::memcached {

// =============================================================================
// Key hash / distribution
// =============================================================================

export enum class hash_kind {
    md5,        // first 4 digest bytes, little endian (ketama)
    fnv1a_32,
    crc,        // (crc32 >> 16) & 0x7fff, libmemcached flavour
};

export constexpr auto hash_name(hash_kind h) noexcept -> std::string_view {
    switch (h) {
        case hash_kind::md5:      return "md5";
        case hash_kind::fnv1a_32: return "fnv1a_32";
        case hash_kind::crc:      return "crc";
    }
    return "?";
}

// =============================================================================
// behaviors: client tuning, pylibmc option names
// =============================================================================

/// Applied once when a client is built; never changed afterwards.
export struct behaviors {
    bool tcp_nodelay = false;
    bool ketama      = false;     // consistent hashing, modula otherwise
    hash_kind hash   = hash_kind::md5;

    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
    std::chrono::microseconds send_timeout    = std::chrono::seconds(10);
    std::chrono::microseconds receive_timeout = std::chrono::seconds(10);

    /// Idle sockets kept per node
    std::size_t max_idle_connections = 4;

    friend auto operator==(const behaviors&, const behaviors&) -> bool = default;
};

/// Upper bound for every socket timeout behavior (one day)
export inline constexpr auto max_socket_timeout = std::chrono::milliseconds(86'400'000);

export inline constexpr std::size_t max_idle_limit = 1024;

/// pylibmc behaviors with no counterpart here. Accepted and ignored so
/// existing option blocks keep working.
export inline constexpr std::array<std::string_view, 20> ignored_behaviors{
    "binary", "no_block", "cas", "buffer_requests", "verify_keys",
    "remove_failed", "dead_timeout", "retry_timeout", "failure_limit",
    "auto_eject", "num_replicas", "distribution", "ketama_weighted",
    "ketama_hash", "noreply", "sort_hosts", "poll_timeout",
    "io_msg_watermark", "io_bytes_watermark", "io_key_prefetch",
};

namespace detail {

inline auto lower(std::string_view s) -> std::string {
    std::string out(s);
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline auto invalid_value(std::string_view name, std::string_view value) -> error {
    return error{make_error_code(clustermc::errc::invalid_argument),
                 std::format("invalid value '{}' for behavior '{}'", value, name)};
}

} // namespace detail

/// true/false, 1/0, yes/no, on/off (case-insensitive)
export inline auto parse_flag(std::string_view value) -> std::optional<bool> {
    auto v = detail::lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")  return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return std::nullopt;
}

/// Decimal integer in [0, max]
export inline auto parse_count(std::string_view value,
                               std::uint64_t max = std::numeric_limits<std::uint64_t>::max())
    -> std::optional<std::uint64_t>
{
    std::uint64_t n = 0;
    if (value.empty()) return std::nullopt;
    auto [p, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
    if (ec != std::errc{} || p != value.data() + value.size() || n > max)
        return std::nullopt;
    return n;
}

/// Sets one behavior by name. Fails with errc::invalid_argument for unknown
/// names and unparsable values.
export inline auto apply_behavior(behaviors& b, std::string_view name, std::string_view value)
    -> std::expected<void, error>
{
    auto key = detail::lower(name);

    if (key == "tcp_nodelay" || key == "ketama") {
        auto f = parse_flag(value);
        if (!f) return std::unexpected(detail::invalid_value(name, value));
        (key == "tcp_nodelay" ? b.tcp_nodelay : b.ketama) = *f;
        return {};
    }

    if (key == "connect_timeout") {
        auto n = parse_count(value, static_cast<std::uint64_t>(max_socket_timeout.count()));
        if (!n || *n == 0) return std::unexpected(detail::invalid_value(name, value));
        b.connect_timeout = std::chrono::milliseconds(*n);
        return {};
    }

    if (key == "send_timeout" || key == "receive_timeout") {
        constexpr auto max_us = std::chrono::microseconds(max_socket_timeout).count();
        auto n = parse_count(value, static_cast<std::uint64_t>(max_us));
        if (!n || *n == 0) return std::unexpected(detail::invalid_value(name, value));
        (key == "send_timeout" ? b.send_timeout : b.receive_timeout) =
            std::chrono::microseconds(*n);
        return {};
    }

    if (key == "hash") {
        auto v = detail::lower(value);
        if (v == "md5")           b.hash = hash_kind::md5;
        else if (v == "fnv1a_32") b.hash = hash_kind::fnv1a_32;
        else if (v == "crc")      b.hash = hash_kind::crc;
        else return std::unexpected(detail::invalid_value(name, value));
        return {};
    }

    if (key == "max_idle_connections") {
        auto n = parse_count(value, max_idle_limit);
        if (!n) return std::unexpected(detail::invalid_value(name, value));
        b.max_idle_connections = static_cast<std::size_t>(*n);
        return {};
    }

    // pylibmc spells some of these with a leading underscore
    auto bare = std::string_view(key);
    if (bare.starts_with('_')) bare.remove_prefix(1);
    if (std::ranges::find(ignored_behaviors, bare) != ignored_behaviors.end()) {
        logger::warn("behavior '{}' is not supported, ignored", name);
        return {};
    }

    return std::unexpected(error{make_error_code(clustermc::errc::invalid_argument),
                                 std::format("unknown behavior '{}'", name)});
}

/// Socket timeouts take milliseconds; round up so 1..999 us is not 0
export constexpr auto to_socket_timeout(std::chrono::microseconds us) noexcept
    -> std::chrono::milliseconds
{
    return std::chrono::ceil<std::chrono::milliseconds>(us);
}

} // namespace clustermc::memcached

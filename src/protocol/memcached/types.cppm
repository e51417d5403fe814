module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:types;

import std;

namespace clustermc::memcached {

// =============================================================================
// Protocol limits
// =============================================================================

export inline constexpr std::size_t max_key_length = 250;

/// Larger expiration values are read by the server as absolute unix time
export inline constexpr std::int64_t max_relative_expiration = 60 * 60 * 24 * 30;

/// The server parses exptime as a signed 32-bit value
export inline constexpr std::int64_t max_expiration = std::numeric_limits<std::int32_t>::max();

/// Longest TTL accepted from configuration (one year)
export inline constexpr auto max_ttl = std::chrono::seconds(60 * 60 * 24 * 365);

// =============================================================================
// server_address
// =============================================================================

export struct server_address {
    std::string   host;
    std::uint16_t port = CLUSTERMC_DEFAULT_PORT;

    [[nodiscard]] auto to_string() const -> std::string {
        return std::format("{}:{}", host, port);
    }

    friend auto operator==(const server_address&, const server_address&) -> bool = default;
};

// =============================================================================
// Reply kinds (text protocol)
// =============================================================================

export enum class reply_kind {
    value,          // VALUE <key> <flags> <bytes> [<cas>] + data block
    config,         // CONFIG <key> <flags> <bytes> + data block
    end,            // END
    stored,         // STORED
    not_stored,     // NOT_STORED
    exists,         // EXISTS
    not_found,      // NOT_FOUND
    deleted,        // DELETED
    version,        // VERSION <v>
    error,          // ERROR
    client_error,   // CLIENT_ERROR <msg>
    server_error,   // SERVER_ERROR <msg>
};

export constexpr auto kind_name(reply_kind k) noexcept -> std::string_view {
    switch (k) {
        case reply_kind::value:        return "VALUE";
        case reply_kind::config:       return "CONFIG";
        case reply_kind::end:          return "END";
        case reply_kind::stored:       return "STORED";
        case reply_kind::not_stored:   return "NOT_STORED";
        case reply_kind::exists:       return "EXISTS";
        case reply_kind::not_found:    return "NOT_FOUND";
        case reply_kind::deleted:      return "DELETED";
        case reply_kind::version:      return "VERSION";
        case reply_kind::error:        return "ERROR";
        case reply_kind::client_error: return "CLIENT_ERROR";
        case reply_kind::server_error: return "SERVER_ERROR";
    }
    return "?";
}

/// One parsed reply line (with its data block for VALUE / CONFIG)
export struct reply {
    reply_kind    kind  = reply_kind::end;
    std::string   key;          // VALUE / CONFIG
    std::uint32_t flags = 0;    // VALUE / CONFIG
    std::string   data;         // data block, version string or error text

    [[nodiscard]] auto is_data() const noexcept -> bool {
        return kind == reply_kind::value || kind == reply_kind::config;
    }

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return kind == reply_kind::error ||
               kind == reply_kind::client_error ||
               kind == reply_kind::server_error;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        switch (kind) {
        case reply_kind::value:
        case reply_kind::config:
            return std::format("{} {} {} ({} bytes)",
                kind_name(kind), key, flags, data.size());
        case reply_kind::version:
        case reply_kind::client_error:
        case reply_kind::server_error:
            return std::format("{} {}", kind_name(kind), data);
        default:
            return std::string(kind_name(kind));
        }
    }
};

// =============================================================================
// memcached error codes
// =============================================================================

export enum class errc {
    success = 0,
    protocol_error,         // unparsable reply
    server_error,           // SERVER_ERROR
    client_error,           // CLIENT_ERROR
    unknown_command,        // ERROR
    invalid_key,            // rejected before sending
    no_servers,             // empty node list
    unsupported_response,   // well-formed but not valid for the command
    hash_unavailable,       // MD5 digest not offered by the crypto provider
};

namespace detail {

class memcached_error_category_impl : public std::error_category {
public:
    auto name() const noexcept -> const char* override { return "clustermc.memcached"; }
    auto message(int ev) const -> std::string override {
        switch (static_cast<errc>(ev)) {
            case errc::success:              return "success";
            case errc::protocol_error:       return "memcached protocol error";
            case errc::server_error:         return "memcached server error";
            case errc::client_error:         return "memcached client error";
            case errc::unknown_command:      return "unknown command";
            case errc::invalid_key:          return "invalid key";
            case errc::no_servers:           return "no servers available";
            case errc::unsupported_response: return "unsupported response";
            case errc::hash_unavailable:     return "MD5 digest unavailable";
            default:                         return "unrecognized memcached error";
        }
    }
};

inline auto memcached_category_instance() -> const std::error_category& {
    static const memcached_error_category_impl instance;
    return instance;
}

} // namespace detail

export inline auto memcached_category() noexcept -> const std::error_category& {
    return detail::memcached_category_instance();
}

export inline auto make_error_code(errc e) noexcept -> std::error_code {
    return {static_cast<int>(e), detail::memcached_category_instance()};
}

/// Error code for an ERROR / CLIENT_ERROR / SERVER_ERROR reply,
/// unsupported_response for anything else
export inline auto error_from_reply(const reply& r) noexcept -> std::error_code {
    switch (r.kind) {
        case reply_kind::error:        return make_error_code(errc::unknown_command);
        case reply_kind::client_error: return make_error_code(errc::client_error);
        case reply_kind::server_error: return make_error_code(errc::server_error);
        default:                       return make_error_code(errc::unsupported_response);
    }
}

// =============================================================================
// Keys
// =============================================================================

/// 1..250 bytes, no control characters, no spaces
export constexpr auto is_valid_key(std::string_view key) noexcept -> bool {
    if (key.empty() || key.size() > max_key_length)
        return false;
    for (char c : key) {
        auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7f)
            return false;
    }
    return true;
}

export inline auto validate_key(std::string_view key)
    -> std::expected<void, std::error_code>
{
    if (!is_valid_key(key))
        return std::unexpected(make_error_code(errc::invalid_key));
    return {};
}

// =============================================================================
// Expiration
// =============================================================================

/// Wire expiration for a TTL.
///   nullopt       -> 0 (never expires)
///   <= 0          -> -1 (expires immediately)
///   > 30 days     -> now + ttl as unix time, clamped to max_expiration
///   otherwise     -> ttl in seconds
export inline auto encode_expiration(
    std::optional<std::chrono::seconds> ttl,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
    -> std::int64_t
{
    if (!ttl)
        return 0;
    auto secs = ttl->count();
    if (secs <= 0)
        return -1;
    if (secs > max_relative_expiration) {
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();
        if (epoch < 0) epoch = 0;
        if (secs > max_expiration - epoch)
            return max_expiration;
        return epoch + secs;
    }
    return secs;
}

} // namespace clustermc::memcached

template <>
struct std::is_error_code_enum<clustermc::memcached::errc> : std::true_type {};

module;

#include <clustermc/config.hpp>

export module clustermc.cluster:config;

import std;
import :types;
import :client_cache;
import clustermc.core.error;
import clustermc.protocol.memcached;

namespace clustermc {

// =============================================================================
// backend_config
// =============================================================================

export struct backend_config {
    std::optional<std::chrono::milliseconds> discovery_timeout;   // nullopt = transport default
    bool                                     ignore_cluster_errors = false;
    client_storage                           storage = client_storage::per_instance;

    /// TTL used by set / set_many when the caller gives none; nullopt = never expire
    std::optional<std::chrono::seconds> default_ttl;

    memcached::behaviors   behaviors;
    memcached::tls_options tls;
};

namespace detail {

inline auto upper(std::string_view s) -> std::string {
    std::string out(s);
    for (auto& c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

inline auto invalid_option(std::string_view key, std::string_view value) -> error {
    return error{make_error_code(cluster_errc::invalid_option),
                 std::format("invalid value '{}' for option {}", value, key)};
}

/// Seconds, decimal allowed ("2.5")
inline auto parse_seconds(std::string_view s) -> std::optional<std::chrono::milliseconds> {
    double secs = 0;
    if (s.empty()) return std::nullopt;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), secs);
    if (ec != std::errc{} || p != s.data() + s.size() || !(secs > 0) || secs > 86400.0)
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::ceil(secs * 1000.0)));
}

} // namespace detail

/// Flat option mapping -> backend_config.
///
/// Reserved keys (case-insensitive): DISCOVERY_TIMEOUT, IGNORE_CLUSTER_ERRORS,
/// CLIENT_STORAGE, TIMEOUT, TLS, TLS_VERIFY, TLS_CA_FILE, TLS_SNI. Every other
/// key is a behavior, matched lower-cased. Fails with
/// cluster_errc::invalid_option on the first bad entry.
export inline auto parse_backend_config(const std::map<std::string, std::string>& options)
    -> std::expected<backend_config, error>
{
    backend_config cfg;

    for (auto& [raw_key, value] : options) {
        auto key = detail::upper(raw_key);

        if (key == "DISCOVERY_TIMEOUT") {
            auto t = detail::parse_seconds(value);
            if (!t) return std::unexpected(detail::invalid_option(key, value));
            cfg.discovery_timeout = *t;
        }
        else if (key == "IGNORE_CLUSTER_ERRORS" || key == "TLS" || key == "TLS_VERIFY") {
            auto f = memcached::parse_flag(value);
            if (!f) return std::unexpected(detail::invalid_option(key, value));
            if (key == "IGNORE_CLUSTER_ERRORS") cfg.ignore_cluster_errors = *f;
            else if (key == "TLS")              cfg.tls.enabled = *f;
            else                                cfg.tls.verify = *f;
        }
        else if (key == "CLIENT_STORAGE") {
            auto v = detail::upper(value);
            if (v == "INSTANCE")    cfg.storage = client_storage::per_instance;
            else if (v == "THREAD") cfg.storage = client_storage::per_thread;
            else return std::unexpected(detail::invalid_option(key, value));
        }
        else if (key == "TIMEOUT") {
            if (detail::upper(value) == "NONE") {
                cfg.default_ttl.reset();
                continue;
            }
            std::int64_t secs = 0;
            auto [p, ec] = std::from_chars(value.data(), value.data() + value.size(), secs);
            if (value.empty() || ec != std::errc{} || p != value.data() + value.size()
                || secs > memcached::max_ttl.count())
                return std::unexpected(detail::invalid_option(key, value));
            cfg.default_ttl = std::chrono::seconds(secs);
        }
        else if (key == "TLS_CA_FILE") {
            cfg.tls.ca_file = value;
        }
        else if (key == "TLS_SNI") {
            cfg.tls.sni = value;
        }
        else if (auto r = memcached::apply_behavior(cfg.behaviors, raw_key, value); !r) {
            return std::unexpected(error{make_error_code(cluster_errc::invalid_option),
                                         r.error().message()});
        }
    }

#ifndef CLUSTERMC_HAS_SSL
    if (cfg.tls.enabled)
        return std::unexpected(error{make_error_code(cluster_errc::invalid_option),
                                     "TLS requested but support is not compiled in"});
#endif
    return cfg;
}

} // namespace clustermc

module;

#include <clustermc/config.hpp>

export module clustermc.cluster:cluster_cache;

import std;
import :types;
import :discovery;
import :membership_cache;
import :kv_client;
import :client_cache;
import :self_healing;
import :config;
import clustermc.core.error;
import clustermc.core.log;

namespace clustermc {

// =============================================================================
// cluster_cache: cache backend over an auto-discovered cluster
// =============================================================================

/// The five cache operations, each run through run_with_self_healing.
///
///   auto cfg   = parse_backend_config({{"DISCOVERY_TIMEOUT", "2"}});
///   auto cache = cluster_cache::create("cfg.example.com:11211", *cfg);
///   (*cache)->set("k", "v", std::nullopt);
///   auto v = (*cache)->get("k");
///
/// No network I/O happens before the first operation.
export class cluster_cache {
    struct private_tag {};

public:
    /// location: one "host:port", or a ';' / ',' separated list that must
    /// hold exactly one entry
    [[nodiscard]] static auto create(std::string_view location,
                                     backend_config config,
                                     discoverer discover_fn = discover,
                                     client_factory factory = make_memcached_client)
        -> std::expected<std::unique_ptr<cluster_cache>, error>
    {
        auto locations = split_location(location);
        return create(std::span<const std::string>(locations), std::move(config),
                      std::move(discover_fn), std::move(factory));
    }

    [[nodiscard]] static auto create(std::span<const std::string> locations,
                                     backend_config config,
                                     discoverer discover_fn = discover,
                                     client_factory factory = make_memcached_client)
        -> std::expected<std::unique_ptr<cluster_cache>, error>
    {
        // count before syntax: "a:1;b" is multiple_endpoints
        auto ep = parse_single_endpoint(locations);
        if (!ep) return std::unexpected(ep.error());

        logger::debug("cluster cache: endpoint {}, storage {}, ignore_cluster_errors {}",
                      ep->to_string(), storage_name(config.storage),
                      config.ignore_cluster_errors);
        return std::make_unique<cluster_cache>(private_tag{},
            std::move(*ep), std::move(config), std::move(discover_fn), std::move(factory));
    }

    cluster_cache(const cluster_cache&) = delete;
    auto operator=(const cluster_cache&) -> cluster_cache& = delete;

    // ── Operations ────────────────────────────────────────────────────────

    /// nullopt on a miss
    [[nodiscard]] auto get(std::string_view key)
        -> std::expected<std::optional<std::string>, error>
    {
        return run_with_self_healing(membership_, clients_,
            [&](kv_client& c) { return c.get(key); });
    }

    /// Hits only
    [[nodiscard]] auto get_many(std::span<const std::string> keys)
        -> std::expected<std::unordered_map<std::string, std::string>, error>
    {
        return run_with_self_healing(membership_, clients_,
            [&](kv_client& c) { return c.get_many(keys); });
    }

    /// ttl nullopt = the configured default TIMEOUT
    [[nodiscard]] auto set(std::string_view key, std::string_view value,
                           std::optional<std::chrono::seconds> ttl = std::nullopt)
        -> std::expected<bool, error>
    {
        auto effective = ttl ? ttl : config_.default_ttl;
        return run_with_self_healing(membership_, clients_,
            [&](kv_client& c) { return c.set(key, value, effective); });
    }

    /// Keys that were not stored
    [[nodiscard]] auto set_many(std::span<const std::pair<std::string, std::string>> items,
                                std::optional<std::chrono::seconds> ttl = std::nullopt)
        -> std::expected<std::vector<std::string>, error>
    {
        auto effective = ttl ? ttl : config_.default_ttl;
        return run_with_self_healing(membership_, clients_,
            [&](kv_client& c) { return c.set_many(items, effective); });
    }

    /// Delete; true when the key existed
    [[nodiscard]] auto remove(std::string_view key) -> std::expected<bool, error> {
        return run_with_self_healing(membership_, clients_,
            [&](kv_client& c) { return c.remove(key); });
    }

    // ── Introspection ────────────────────────────────────────────────────

    [[nodiscard]] auto endpoint() const noexcept -> const configuration_endpoint& {
        return membership_.endpoint();
    }

    /// Node list and client handle both cached
    [[nodiscard]] auto is_warm() const -> bool {
        return membership_.has_nodes() && clients_.has_client();
    }

    [[nodiscard]] auto membership() noexcept -> membership_cache& { return membership_; }
    [[nodiscard]] auto clients() noexcept -> client_cache& { return clients_; }
    [[nodiscard]] auto config() const noexcept -> const backend_config& { return config_; }

    cluster_cache(private_tag, configuration_endpoint ep, backend_config config,
                  discoverer discover_fn, client_factory factory)
        : config_(std::move(config))
        , membership_(std::move(ep), config_.discovery_timeout,
                      config_.ignore_cluster_errors, config_.tls, std::move(discover_fn))
        , clients_(membership_, kv_client_settings{config_.behaviors, config_.tls},
                   config_.storage, std::move(factory))
    {}

private:
    backend_config   config_;
    membership_cache membership_;
    client_cache     clients_;
};

} // namespace clustermc

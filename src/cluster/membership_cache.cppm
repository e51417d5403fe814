module;

#include <clustermc/config.hpp>

export module clustermc.cluster:membership_cache;

import std;
import :types;
import :discovery;
import clustermc.core.error;
import clustermc.core.log;
import clustermc.protocol.memcached;

namespace clustermc {

// =============================================================================
// membership_cache: the believed node list
// =============================================================================

/// Holds the last discovery result until invalidate(). No TTL.
///
/// Readers see a complete configuration or none. Discovery is serialized:
/// concurrent cold callers wait for the first one and reuse its result.
/// A result that arrives after an invalidate() issued during its discovery
/// is handed to its caller but not cached.
export class membership_cache {
public:
    membership_cache(configuration_endpoint endpoint,
                     std::optional<std::chrono::milliseconds> timeout,
                     bool ignore_cluster_errors,
                     memcached::tls_options tls = {},
                     discoverer discover_fn = discover)
        : request_{std::move(endpoint), timeout, ignore_cluster_errors, std::move(tls)}
        , discover_(std::move(discover_fn))
    {}

    membership_cache(const membership_cache&) = delete;
    auto operator=(const membership_cache&) -> membership_cache& = delete;

    /// Cached configuration, discovering it first when cold
    [[nodiscard]] auto get_config()
        -> std::expected<std::shared_ptr<const cluster_config>, error>
    {
        if (auto cfg = snapshot()) return cfg;

        std::lock_guard discovery_lock(discovery_mtx_);

        std::uint64_t epoch = 0;
        {
            std::lock_guard lock(state_mtx_);
            if (cached_) return cached_;
            epoch = epoch_;
        }

        auto r = discover_(request_);
        if (!r) return std::unexpected(wrap_error(std::move(r.error())));

        auto cfg = std::make_shared<const cluster_config>(std::move(*r));
        {
            std::lock_guard lock(state_mtx_);
            if (epoch_ == epoch) {
                cached_ = cfg;
                logger::debug("membership: cached {} node(s) for {}",
                              cfg->nodes.size(), request_.endpoint.to_string());
            } else {
                logger::debug("membership: invalidated during discovery, result not cached");
            }
        }
        return cfg;
    }

    /// Cached node list; the same pointer until the next invalidate()
    [[nodiscard]] auto get_nodes()
        -> std::expected<std::shared_ptr<const node_list>, error>
    {
        auto cfg = get_config();
        if (!cfg) return std::unexpected(cfg.error());
        return std::shared_ptr<const node_list>(*cfg, &(*cfg)->nodes);
    }

    /// Current entry without discovering; null when cold
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const cluster_config> {
        std::lock_guard lock(state_mtx_);
        return cached_;
    }

    [[nodiscard]] auto has_nodes() const -> bool {
        std::lock_guard lock(state_mtx_);
        return cached_ != nullptr;
    }

    /// Idempotent
    void invalidate() {
        std::lock_guard lock(state_mtx_);
        ++epoch_;
        if (cached_) {
            logger::debug("membership: dropped node list for {}", request_.endpoint.to_string());
            cached_.reset();
        }
    }

    /// Number of invalidate() calls so far
    [[nodiscard]] auto epoch() const -> std::uint64_t {
        std::lock_guard lock(state_mtx_);
        return epoch_;
    }

    [[nodiscard]] auto endpoint() const noexcept -> const configuration_endpoint& {
        return request_.endpoint;
    }

private:
    /// Connectivity failures become cluster_unreachable, the rest pass through
    auto wrap_error(error e) const -> error {
        if (!is_connectivity_error(e.code()))
            return e;
        return error{make_error_code(cluster_errc::cluster_unreachable),
                     std::format("Cannot connect to cluster {} ({})",
                                 request_.endpoint.to_string(), e.message()),
                     e.code()};
    }

    discovery_request request_;
    discoverer        discover_;

    std::mutex discovery_mtx_;   // one discovery at a time

    mutable std::mutex                    state_mtx_;
    std::shared_ptr<const cluster_config> cached_;
    std::uint64_t                         epoch_ = 0;
};

} // namespace clustermc

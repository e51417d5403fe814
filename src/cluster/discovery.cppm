module;

#include <clustermc/config.hpp>

export module clustermc.cluster:discovery;

import std;
import :types;
import clustermc.core.error;
import clustermc.core.log;
import clustermc.protocol.memcached;

namespace clustermc {

/// Used when no discovery timeout is configured
export inline constexpr std::chrono::milliseconds default_transport_timeout{10000};

// =============================================================================
// discovery_request
// =============================================================================

export struct discovery_request {
    configuration_endpoint                   endpoint;
    std::optional<std::chrono::milliseconds> timeout;   // nullopt = transport default
    bool                                     ignore_cluster_errors = false;
    memcached::tls_options                   tls;
};

/// Replaceable for tests
export using discoverer =
    std::function<std::expected<cluster_config, error>(const discovery_request&)>;

namespace detail {

/// The endpoint stands in for the whole cluster
inline auto single_node(const discovery_request& req) -> cluster_config {
    return cluster_config{0, {}, {node_address{req.endpoint.host, req.endpoint.port}}};
}

inline auto exchange(memcached::connection& conn, const memcached::request& req)
    -> std::expected<memcached::reply, error>
{
    if (auto s = conn.send(req); !s) return std::unexpected(s.error());
    return conn.read_reply();
}

inline auto unexpected_reply(const memcached::connection& conn, const memcached::reply& r)
    -> error
{
    return error{memcached::error_from_reply(r),
                 std::format("unexpected reply to cluster discovery from {}: {}",
                             conn.remote(), r.to_string())};
}

inline auto run_discovery(const discovery_request& req)
    -> std::expected<cluster_config, error>
{
    auto timeout = req.timeout.value_or(default_transport_timeout);

    memcached::connection_options opts;
    opts.host            = req.endpoint.host;
    opts.port            = req.endpoint.port;
    opts.connect_timeout = timeout;
    opts.send_timeout    = timeout;
    opts.receive_timeout = timeout;
#ifdef CLUSTERMC_HAS_SSL
    if (req.tls.enabled) {
        auto ctx = memcached::make_tls_context(req.tls);
        if (!ctx) return std::unexpected(ctx.error());
        opts.tls     = std::move(*ctx);
        opts.tls_sni = req.tls.sni;
    }
#else
    if (req.tls.enabled)
        return std::unexpected(error{make_error_code(errc::operation_not_supported),
                                     "TLS support is not compiled in"});
#endif

    auto conn = memcached::connection::open(opts);
    if (!conn) return std::unexpected(conn.error());

    // 1. engine version
    memcached::request version_req;
    version_req.push_version();
    auto vr = exchange(**conn, version_req);
    if (!vr) return std::unexpected(vr.error());
    if (vr->kind != memcached::reply_kind::version)
        return std::unexpected(unexpected_reply(**conn, *vr));

    // "1.6.12" or "1.4.14 (Ubuntu)"
    std::vector<std::string_view> tokens;
    std::string_view rest = vr->data;
    while (!rest.empty()) {
        auto sp = rest.find(' ');
        if (sp != 0) tokens.push_back(rest.substr(0, sp));
        if (sp == std::string_view::npos) break;
        rest.remove_prefix(sp + 1);
    }
    if (tokens.empty() || tokens.size() > 2)
        return std::unexpected(error{make_error_code(memcached::errc::unsupported_response),
            std::format("unexpected version reply from {}: '{}'", (*conn)->remote(), vr->data)});
    std::string engine(tokens[0]);

    // 2. cluster configuration
    memcached::request config_req;
    if (supports_config_command(engine))
        config_req.push_config_get_cluster();
    else
        config_req.push_legacy_config_get();

    auto cr = exchange(**conn, config_req);
    if (!cr) return std::unexpected(cr.error());

    // ERROR (unknown command) or a miss on the legacy key: not a cluster endpoint
    if (cr->kind == memcached::reply_kind::error || cr->kind == memcached::reply_kind::end) {
        if (req.ignore_cluster_errors) {
            logger::info("cluster: {} is not a cluster endpoint, using it as the only node",
                         req.endpoint.to_string());
            auto cfg = single_node(req);
            cfg.engine_version = engine;
            return cfg;
        }
        return std::unexpected(error{make_error_code(memcached::errc::unknown_command),
            std::format("{} does not answer cluster discovery ({})",
                        req.endpoint.to_string(), cr->to_string())});
    }
    if (!cr->is_data())
        return std::unexpected(unexpected_reply(**conn, *cr));

    auto end = (*conn)->read_reply();
    if (!end) return std::unexpected(end.error());
    if (end->kind != memcached::reply_kind::end)
        return std::unexpected(unexpected_reply(**conn, *end));

    auto cfg = parse_cluster_payload(cr->data);
    if (!cfg) return std::unexpected(cfg.error());
    cfg->engine_version = std::move(engine);
    return cfg;
}

} // namespace detail

// =============================================================================
// discover
// =============================================================================

/// Asks the configuration endpoint for the current node list.
///
/// One connection per call, closed before returning; no retry. With
/// ignore_cluster_errors an endpoint that is no cluster endpoint becomes the
/// only node, and an unreachable one yields an empty node list.
export inline auto discover(const discovery_request& req)
    -> std::expected<cluster_config, error>
{
    auto r = detail::run_discovery(req);
    if (r) {
        logger::info("cluster: {} reports {} node(s), config version {}",
                     req.endpoint.to_string(), r->nodes.size(), r->config_version);
        return r;
    }

    if (req.ignore_cluster_errors && is_connectivity_error(r.error().code())) {
        logger::warn("cluster: {} unreachable ({}), continuing without nodes",
                     req.endpoint.to_string(), r.error().message());
        return cluster_config{};
    }

    logger::warn("cluster: discovery through {} failed: {}",
                  req.endpoint.to_string(), r.error().message());
    return r;
}

} // namespace clustermc

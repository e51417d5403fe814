module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:client;

import std;
import :types;
import :request;
import :connection;
import :behaviors;
import :hashing;
import :pool;
import clustermc.core.error;
import clustermc.core.log;
#ifdef CLUSTERMC_HAS_SSL
import clustermc.core.ssl;
#endif

namespace clustermc::memcached {

// =============================================================================
// memcached::client: blocking multi-node client
// =============================================================================

/// Keys are distributed over the server list with node_locator; each
/// server has its own idle connection pool. Safe to share between threads.
///
///   auto c = client::create(servers, behaviors{});
///   auto v = (*c)->get("k");          // expected<optional<string>, error>
///
/// An empty server list is valid; every operation then fails with
/// errc::no_servers.
export class client {
    struct private_tag {};

public:
    [[nodiscard]] static auto create(std::span<const server_address> servers,
                                     const behaviors& b,
                                     const tls_options& tls = {})
        -> std::expected<std::unique_ptr<client>, error>
    {
        connection_options base;
        base.connect_timeout = b.connect_timeout;
        base.send_timeout    = to_socket_timeout(b.send_timeout);
        base.receive_timeout = to_socket_timeout(b.receive_timeout);
        base.no_delay        = b.tcp_nodelay;

        if (tls.enabled) {
#ifdef CLUSTERMC_HAS_SSL
            auto ctx = make_tls_context(tls);
            if (!ctx) return std::unexpected(ctx.error());
            base.tls     = std::move(*ctx);
            base.tls_sni = tls.sni;
#else
            return std::unexpected(error{make_error_code(clustermc::errc::operation_not_supported),
                                         "TLS support is not compiled in"});
#endif
        }

        std::vector<std::string> names;
        names.reserve(servers.size());
        for (auto& srv : servers)
            names.push_back(ketama_name(srv.host, srv.port));
        auto locator = node_locator::create(names, b.ketama, b.hash);
        if (!locator)
            return std::unexpected(error{locator.error(),
                std::format("cannot use hash '{}'{}: MD5 is not available from the crypto provider",
                            hash_name(b.hash), b.ketama ? " with ketama" : "")});

        return std::make_unique<client>(private_tag{}, servers, b, base, std::move(*locator));
    }

    client(private_tag, std::span<const server_address> servers, const behaviors& b,
           const connection_options& base, node_locator locator)
        : servers_(servers.begin(), servers.end()), behaviors_(b), locator_(std::move(locator))
    {
        pools_.reserve(servers_.size());
        for (auto& s : servers_) {
            auto opts = base;
            opts.host = s.host;
            opts.port = s.port;
            pools_.push_back(std::make_unique<node_pool>(std::move(opts), b.max_idle_connections));
        }
    }

    client(const client&) = delete;
    auto operator=(const client&) -> client& = delete;

    // ── Operations ────────────────────────────────────────────────────────

    [[nodiscard]] auto get(std::string_view key)
        -> std::expected<std::optional<std::string>, error>
    {
        if (auto r = check_key(key); !r) return std::unexpected(r.error());

        auto conn = acquire(key);
        if (!conn) return std::unexpected(conn.error());

        request req;
        req.push_get(key);
        auto values = fetch(conn->get(), req);
        if (!values) return std::unexpected(values.error());

        std::optional<std::string> out;
        for (auto& [k, v] : *values)
            if (k == key) out = std::move(v);
        return out;
    }

    /// Missing keys are absent from the result. One multi-key get per server.
    [[nodiscard]] auto get_many(std::span<const std::string> keys)
        -> std::expected<std::unordered_map<std::string, std::string>, error>
    {
        if (pools_.empty()) return std::unexpected(no_servers());
        for (auto& k : keys)
            if (auto r = check_key(k); !r) return std::unexpected(r.error());

        auto groups = group_by_server(keys);
        if (!groups) return std::unexpected(groups.error());

        std::unordered_map<std::string, std::string> out;
        for (auto& [idx, group] : *groups) {
            std::vector<std::string_view> views;
            views.reserve(group.size());
            for (auto i : group) views.push_back(keys[i]);

            auto conn = pools_[idx]->acquire();
            if (!conn) return std::unexpected(conn.error());

            request req;
            req.push_get(views);
            auto values = fetch(conn->get(), req);
            if (!values) return std::unexpected(values.error());
            for (auto& [k, v] : *values)
                out.insert_or_assign(std::move(k), std::move(v));
        }
        return out;
    }

    /// true when stored
    [[nodiscard]] auto set(std::string_view key, std::string_view value,
                           std::optional<std::chrono::seconds> ttl = std::nullopt,
                           std::uint32_t flags = 0)
        -> std::expected<bool, error>
    {
        if (auto r = check_key(key); !r) return std::unexpected(r.error());

        auto conn = acquire(key);
        if (!conn) return std::unexpected(conn.error());

        request req;
        req.push_set(key, value, flags, encode_expiration(ttl));
        if (auto s = conn->get().send(req); !s) return std::unexpected(s.error());

        auto r = conn->get().read_reply();
        if (!r) return std::unexpected(r.error());
        switch (r->kind) {
            case reply_kind::stored:     return true;
            case reply_kind::not_stored: return false;
            default:                     return std::unexpected(reply_error(conn->get(), *r));
        }
    }

    /// Keys that were not stored. The sets for one server go out in a single write.
    [[nodiscard]] auto set_many(std::span<const std::pair<std::string, std::string>> items,
                                std::optional<std::chrono::seconds> ttl = std::nullopt)
        -> std::expected<std::vector<std::string>, error>
    {
        if (pools_.empty()) return std::unexpected(no_servers());

        std::vector<std::string> keys;
        keys.reserve(items.size());
        for (auto& [k, v] : items) {
            if (auto r = check_key(k); !r) return std::unexpected(r.error());
            keys.push_back(k);
        }

        auto exptime = encode_expiration(ttl);
        auto groups = group_by_server(keys);
        if (!groups) return std::unexpected(groups.error());

        std::vector<std::string> failed;
        for (auto& [idx, group] : *groups) {
            auto conn = pools_[idx]->acquire();
            if (!conn) return std::unexpected(conn.error());

            request req;
            for (auto i : group)
                req.push_set(items[i].first, items[i].second, 0, exptime);
            if (auto s = conn->get().send(req); !s) return std::unexpected(s.error());

            for (auto i : group) {
                auto r = conn->get().read_reply();
                if (!r) return std::unexpected(r.error());
                switch (r->kind) {
                case reply_kind::stored:
                    break;
                case reply_kind::not_stored:
                case reply_kind::exists:
                case reply_kind::not_found:
                case reply_kind::server_error:
                case reply_kind::client_error:
                    logger::debug("memcached: set '{}' on {} not stored: {}",
                                  items[i].first, conn->get().remote(), r->to_string());
                    failed.push_back(items[i].first);
                    break;
                default:
                    return std::unexpected(reply_error(conn->get(), *r));
                }
            }
        }
        return failed;
    }

    /// true when the key existed
    [[nodiscard]] auto remove(std::string_view key) -> std::expected<bool, error> {
        if (auto r = check_key(key); !r) return std::unexpected(r.error());

        auto conn = acquire(key);
        if (!conn) return std::unexpected(conn.error());

        request req;
        req.push_delete(key);
        if (auto s = conn->get().send(req); !s) return std::unexpected(s.error());

        auto r = conn->get().read_reply();
        if (!r) return std::unexpected(r.error());
        switch (r->kind) {
            case reply_kind::deleted:   return true;
            case reply_kind::not_found: return false;
            default:                    return std::unexpected(reply_error(conn->get(), *r));
        }
    }

    // ── Introspection ────────────────────────────────────────────────────

    [[nodiscard]] auto servers() const noexcept -> const std::vector<server_address>& {
        return servers_;
    }

    [[nodiscard]] auto get_behaviors() const noexcept -> const behaviors& { return behaviors_; }

    /// Server index a key maps to
    [[nodiscard]] auto server_for(std::string_view key) const -> std::expected<std::size_t, error> {
        auto idx = locator_.locate(key);
        if (!idx) return std::unexpected(error{idx.error(), "cannot hash key"});
        return *idx;
    }

    /// Idle pooled connections to one server
    [[nodiscard]] auto idle_connections(std::size_t server) const -> std::size_t {
        return server < pools_.size() ? pools_[server]->idle_count() : 0;
    }

private:
    static auto no_servers() -> error {
        return error{make_error_code(errc::no_servers), "no memcached servers configured"};
    }

    auto check_key(std::string_view key) const -> std::expected<void, error> {
        if (pools_.empty())
            return std::unexpected(no_servers());
        if (auto r = validate_key(key); !r)
            return std::unexpected(error{r.error(),
                std::format("invalid key '{}'", key.substr(0, 64))});
        return {};
    }

    auto acquire(std::string_view key) -> std::expected<pooled_connection, error> {
        auto idx = server_for(key);
        if (!idx) return std::unexpected(idx.error());
        return pools_[*idx]->acquire();
    }

    /// server index -> positions in keys, in first-seen order
    auto group_by_server(std::span<const std::string> keys) const
        -> std::expected<std::vector<std::pair<std::size_t, std::vector<std::size_t>>>, error>
    {
        std::vector<std::pair<std::size_t, std::vector<std::size_t>>> groups;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            auto idx = server_for(keys[i]);
            if (!idx) return std::unexpected(idx.error());
            auto it = std::find_if(groups.begin(), groups.end(),
                [&](const auto& g) { return g.first == *idx; });
            if (it == groups.end())
                groups.push_back({*idx, {i}});
            else
                it->second.push_back(i);
        }
        return groups;
    }

    /// Sends a get and collects VALUE blocks up to END
    static auto fetch(connection& conn, const request& req)
        -> std::expected<std::vector<std::pair<std::string, std::string>>, error>
    {
        if (auto s = conn.send(req); !s) return std::unexpected(s.error());

        std::vector<std::pair<std::string, std::string>> values;
        for (;;) {
            auto r = conn.read_reply();
            if (!r) return std::unexpected(r.error());
            if (r->kind == reply_kind::end)
                return values;
            if (r->kind != reply_kind::value)
                return std::unexpected(reply_error(conn, *r));
            values.emplace_back(std::move(r->key), std::move(r->data));
        }
    }

    /// Error replies leave the stream in sync; anything else does not
    static auto reply_error(connection& conn, const reply& r) -> error {
        if (!r.is_error())
            conn.mark_broken();
        auto ec = error_from_reply(r);
        if (r.data.empty())
            return error{ec, std::format("{} from {}", kind_name(r.kind), conn.remote())};
        return error{ec, std::format("{} from {}: {}", kind_name(r.kind), conn.remote(), r.data)};
    }

    std::vector<server_address>             servers_;
    behaviors                               behaviors_;
    node_locator                            locator_;
    std::vector<std::unique_ptr<node_pool>> pools_;
};

} // namespace clustermc::memcached

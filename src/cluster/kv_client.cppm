module;

#include <clustermc/config.hpp>

export module clustermc.cluster:kv_client;

import std;
import :types;
import clustermc.core.error;
import clustermc.protocol.memcached;

namespace clustermc {

// =============================================================================
// kv_client: the key-value operations a cluster cache forwards
// =============================================================================

/// Built against one node list and never re-pointed. Implementations are
/// shared between threads.
export class kv_client {
public:
    virtual ~kv_client() = default;

    virtual auto get(std::string_view key)
        -> std::expected<std::optional<std::string>, error> = 0;

    virtual auto get_many(std::span<const std::string> keys)
        -> std::expected<std::unordered_map<std::string, std::string>, error> = 0;

    virtual auto set(std::string_view key, std::string_view value,
                     std::optional<std::chrono::seconds> ttl)
        -> std::expected<bool, error> = 0;

    /// Keys not stored
    virtual auto set_many(std::span<const std::pair<std::string, std::string>> items,
                          std::optional<std::chrono::seconds> ttl)
        -> std::expected<std::vector<std::string>, error> = 0;

    /// true when the key existed
    virtual auto remove(std::string_view key) -> std::expected<bool, error> = 0;

    [[nodiscard]] virtual auto nodes() const -> const node_list& = 0;
};

/// Construction input besides the node list
export struct kv_client_settings {
    memcached::behaviors   behaviors;
    memcached::tls_options tls;
};

export using client_factory = std::function<
    std::expected<std::shared_ptr<kv_client>, error>(const node_list&, const kv_client_settings&)>;

// =============================================================================
// memcached_kv_client
// =============================================================================

export class memcached_kv_client final : public kv_client {
public:
    memcached_kv_client(node_list nodes, std::unique_ptr<memcached::client> impl)
        : nodes_(std::move(nodes)), impl_(std::move(impl)) {}

    auto get(std::string_view key)
        -> std::expected<std::optional<std::string>, error> override
    {
        return impl_->get(key);
    }

    auto get_many(std::span<const std::string> keys)
        -> std::expected<std::unordered_map<std::string, std::string>, error> override
    {
        return impl_->get_many(keys);
    }

    auto set(std::string_view key, std::string_view value,
             std::optional<std::chrono::seconds> ttl)
        -> std::expected<bool, error> override
    {
        return impl_->set(key, value, ttl);
    }

    auto set_many(std::span<const std::pair<std::string, std::string>> items,
                  std::optional<std::chrono::seconds> ttl)
        -> std::expected<std::vector<std::string>, error> override
    {
        return impl_->set_many(items, ttl);
    }

    auto remove(std::string_view key) -> std::expected<bool, error> override {
        return impl_->remove(key);
    }

    [[nodiscard]] auto nodes() const -> const node_list& override { return nodes_; }

    [[nodiscard]] auto native() noexcept -> memcached::client& { return *impl_; }

private:
    node_list                          nodes_;
    std::unique_ptr<memcached::client> impl_;
};

/// Default client_factory. Behaviors are applied here, once.
export inline auto make_memcached_client(const node_list& nodes, const kv_client_settings& settings)
    -> std::expected<std::shared_ptr<kv_client>, error>
{
    std::vector<memcached::server_address> servers;
    servers.reserve(nodes.size());
    for (auto& n : nodes)
        servers.push_back({n.host, n.port});

    auto impl = memcached::client::create(servers, settings.behaviors, settings.tls);
    if (!impl) return std::unexpected(impl.error());
    return std::make_shared<memcached_kv_client>(nodes, std::move(*impl));
}

} // namespace clustermc

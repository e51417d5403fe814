/// clustermc test support: in-memory kv_client and counting factory
///
/// Include after `import clustermc.cluster;`.

#pragma once

namespace clustermc::test {

/// kv_client over a shared map; fail_next makes the next operations error out
class fake_kv final : public clustermc::kv_client {
public:
    struct state {
        std::mutex                                   mtx;
        std::unordered_map<std::string, std::string> data;
        std::vector<std::optional<std::chrono::seconds>> ttls;
        int fail_next = 0;
        std::error_code fail_with = make_error_code(clustermc::errc::connection_reset);
    };

    fake_kv(clustermc::node_list nodes, std::shared_ptr<state> st)
        : nodes_(std::move(nodes)), st_(std::move(st)) {}

    auto get(std::string_view key)
        -> std::expected<std::optional<std::string>, clustermc::error> override
    {
        std::lock_guard lock(st_->mtx);
        if (auto e = injected()) return std::unexpected(*e);
        auto it = st_->data.find(std::string(key));
        if (it == st_->data.end()) return std::optional<std::string>{};
        return std::optional<std::string>{it->second};
    }

    auto get_many(std::span<const std::string> keys)
        -> std::expected<std::unordered_map<std::string, std::string>, clustermc::error> override
    {
        std::lock_guard lock(st_->mtx);
        if (auto e = injected()) return std::unexpected(*e);
        std::unordered_map<std::string, std::string> out;
        for (auto& k : keys) {
            auto it = st_->data.find(k);
            if (it != st_->data.end()) out.emplace(k, it->second);
        }
        return out;
    }

    auto set(std::string_view key, std::string_view value,
             std::optional<std::chrono::seconds> ttl)
        -> std::expected<bool, clustermc::error> override
    {
        std::lock_guard lock(st_->mtx);
        if (auto e = injected()) return std::unexpected(*e);
        st_->data[std::string(key)] = std::string(value);
        st_->ttls.push_back(ttl);
        return true;
    }

    auto set_many(std::span<const std::pair<std::string, std::string>> items,
                  std::optional<std::chrono::seconds> ttl)
        -> std::expected<std::vector<std::string>, clustermc::error> override
    {
        std::lock_guard lock(st_->mtx);
        if (auto e = injected()) return std::unexpected(*e);
        for (auto& [k, v] : items) {
            st_->data[k] = v;
            st_->ttls.push_back(ttl);
        }
        return std::vector<std::string>{};
    }

    auto remove(std::string_view key) -> std::expected<bool, clustermc::error> override {
        std::lock_guard lock(st_->mtx);
        if (auto e = injected()) return std::unexpected(*e);
        return st_->data.erase(std::string(key)) > 0;
    }

    [[nodiscard]] auto nodes() const -> const clustermc::node_list& override { return nodes_; }

private:
    auto injected() -> std::optional<clustermc::error> {
        if (st_->fail_next <= 0) return std::nullopt;
        --st_->fail_next;
        return clustermc::error{st_->fail_with, "injected failure"};
    }

    clustermc::node_list   nodes_;
    std::shared_ptr<state> st_;
};

/// Factory that counts builds and hands out fake_kv over one shared state
struct fake_factory {
    std::shared_ptr<fake_kv::state> st = std::make_shared<fake_kv::state>();
    std::atomic<int> builds{0};
    std::optional<clustermc::error> fail;
    clustermc::node_list last_nodes;

    auto fn() -> clustermc::client_factory {
        return [this](const clustermc::node_list& nodes, const clustermc::kv_client_settings&)
            -> std::expected<std::shared_ptr<clustermc::kv_client>, clustermc::error>
        {
            if (fail) return std::unexpected(*fail);
            builds.fetch_add(1);
            last_nodes = nodes;
            return std::make_shared<fake_kv>(nodes, st);
        };
    }
};

/// Discoverer that counts calls and returns a fixed (replaceable) result
struct counting_discovery {
    std::mutex mtx;
    std::expected<clustermc::cluster_config, clustermc::error> result;
    std::atomic<int> calls{0};

    explicit counting_discovery(clustermc::cluster_config cfg) : result(std::move(cfg)) {}

    void set(std::expected<clustermc::cluster_config, clustermc::error> r) {
        std::lock_guard lock(mtx);
        result = std::move(r);
    }

    auto fn() -> clustermc::discoverer {
        return [this](const clustermc::discovery_request&)
            -> std::expected<clustermc::cluster_config, clustermc::error>
        {
            calls.fetch_add(1);
            std::lock_guard lock(mtx);
            return result;
        };
    }
};

inline auto sample_config(std::uint64_t version = 1) -> clustermc::cluster_config {
    return clustermc::cluster_config{version, "1.6.12",
                                     {{"10.0.0.1", 11211}, {"10.0.0.2", 11211}}};
}

} // namespace clustermc::test

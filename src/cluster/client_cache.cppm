module;

#include <clustermc/config.hpp>

export module clustermc.cluster:client_cache;

import std;
import :types;
import :membership_cache;
import :kv_client;
import clustermc.core.error;
import clustermc.core.log;

namespace clustermc {

/// Where built client handles are kept
export enum class client_storage {
    per_instance,   // one handle for every thread
    per_thread,     // one handle per calling thread
};

export constexpr auto storage_name(client_storage s) noexcept -> std::string_view {
    return s == client_storage::per_thread ? "thread" : "instance";
}

// =============================================================================
// client_cache: the handle built from the believed node list
// =============================================================================

/// A handle is only returned while the membership entry it was built from is
/// still current, so an invalidation on one thread reaches every thread.
/// invalidate() only drops references; sockets close with the last holder.
export class client_cache {
public:
    client_cache(membership_cache& membership,
                 kv_client_settings settings,
                 client_storage storage = client_storage::per_instance,
                 client_factory factory = make_memcached_client)
        : membership_(membership)
        , settings_(std::move(settings))
        , storage_(storage)
        , factory_(std::move(factory))
    {}

    client_cache(const client_cache&) = delete;
    auto operator=(const client_cache&) -> client_cache& = delete;

    [[nodiscard]] auto get_client() -> std::expected<std::shared_ptr<kv_client>, error> {
        if (auto c = current()) return c;

        if (storage_ == client_storage::per_instance) {
            // cold -> warm once, other threads wait and reuse
            std::lock_guard build_lock(build_mtx_);
            if (auto c = current()) return c;
            return build();
        }
        return build();
    }

    /// per_instance: drops the shared handle. per_thread: drops the caller's.
    void invalidate() {
        std::unique_lock lock(mtx_);
        auto& s = slot_for_write();
        if (s.client)
            logger::debug("client cache: dropped {} handle", storage_name(storage_));
        s = {};
    }

    /// A handle is stored for the caller (it may be stale)
    [[nodiscard]] auto has_client() const -> bool {
        std::shared_lock lock(mtx_);
        auto* s = slot_for_read();
        return s && s->client;
    }

    /// Stored handles; at most one for per_instance
    [[nodiscard]] auto handle_count() const -> std::size_t {
        std::shared_lock lock(mtx_);
        if (storage_ == client_storage::per_instance)
            return instance_.client ? 1 : 0;
        return threads_.size();
    }

    [[nodiscard]] auto storage() const noexcept -> client_storage { return storage_; }
    [[nodiscard]] auto settings() const noexcept -> const kv_client_settings& { return settings_; }

private:
    struct slot {
        std::shared_ptr<kv_client>            client;
        std::shared_ptr<const cluster_config> built_from;
    };

    auto slot_for_read() const -> const slot* {
        if (storage_ == client_storage::per_instance)
            return &instance_;
        auto it = threads_.find(std::this_thread::get_id());
        return it == threads_.end() ? nullptr : &it->second;
    }

    auto slot_for_write() -> slot& {
        if (storage_ == client_storage::per_instance)
            return instance_;
        return threads_[std::this_thread::get_id()];
    }

    /// Stored handle if built from the current membership entry
    auto current() const -> std::shared_ptr<kv_client> {
        auto snap = membership_.snapshot();
        if (!snap) return nullptr;
        std::shared_lock lock(mtx_);
        auto* s = slot_for_read();
        if (!s || !s->client || s->built_from != snap)
            return nullptr;
        return s->client;
    }

    auto build() -> std::expected<std::shared_ptr<kv_client>, error> {
        auto cfg = membership_.get_config();
        if (!cfg) return std::unexpected(cfg.error());

        auto c = factory_((*cfg)->nodes, settings_);
        if (!c) return std::unexpected(c.error());

        logger::debug("client cache: built {} handle for {} node(s)",
                      storage_name(storage_), (*cfg)->nodes.size());
        std::unique_lock lock(mtx_);
        if (storage_ == client_storage::per_thread)
            drop_stale_slots(*cfg);
        slot_for_write() = slot{*c, *cfg};
        return *c;
    }

    /// Releases handles of other threads built from a superseded node list,
    /// including threads that have exited. Caller holds mtx_ exclusively.
    void drop_stale_slots(const std::shared_ptr<const cluster_config>& current) {
        auto dropped = std::erase_if(threads_, [&](const auto& entry) {
            return entry.second.built_from != current;
        });
        if (dropped > 0)
            logger::debug("client cache: released {} stale thread handle(s)", dropped);
    }

    membership_cache&  membership_;
    kv_client_settings settings_;
    client_storage     storage_;
    client_factory     factory_;

    std::mutex build_mtx_;

    mutable std::shared_mutex                  mtx_;
    slot                                       instance_;
    std::unordered_map<std::thread::id, slot>  threads_;
};

} // namespace clustermc

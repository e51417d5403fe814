module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:pool;

import std;
import :connection;
import clustermc.core.error;

namespace clustermc::memcached {

export class node_pool;

// =============================================================================
// pooled_connection: RAII borrowed connection
// =============================================================================
//
// Goes back to its pool on destruction unless it is broken.

export class pooled_connection {
public:
    pooled_connection() noexcept = default;

    pooled_connection(pooled_connection&& o) noexcept
        : pool_(std::exchange(o.pool_, nullptr))
        , conn_(std::move(o.conn_))
    {}

    auto operator=(pooled_connection&& o) noexcept -> pooled_connection& {
        if (this != &o) {
            return_to_pool();
            pool_ = std::exchange(o.pool_, nullptr);
            conn_ = std::move(o.conn_);
        }
        return *this;
    }

    pooled_connection(const pooled_connection&) = delete;
    auto operator=(const pooled_connection&) -> pooled_connection& = delete;

    ~pooled_connection() { return_to_pool(); }

    auto valid() const noexcept -> bool { return conn_ != nullptr; }

    auto get() noexcept -> connection& { return *conn_; }
    auto operator->() noexcept -> connection* { return conn_.get(); }

private:
    friend class node_pool;

    pooled_connection(node_pool* pool, std::unique_ptr<connection> c) noexcept
        : pool_(pool), conn_(std::move(c)) {}

    void return_to_pool() noexcept;

    node_pool*                  pool_ = nullptr;
    std::unique_ptr<connection> conn_;
};

// =============================================================================
// node_pool: idle connections to one server
// =============================================================================

/// Connections are opened on demand, never ahead of time. At most
/// max_idle connections are kept; extra ones close on release.
export class node_pool {
public:
    node_pool(connection_options opts, std::size_t max_idle)
        : opts_(std::move(opts)), max_idle_(max_idle) {}

    node_pool(const node_pool&) = delete;
    auto operator=(const node_pool&) -> node_pool& = delete;

    /// Idle connection if any, a new one otherwise
    [[nodiscard]] auto acquire() -> std::expected<pooled_connection, error> {
        {
            std::lock_guard lock(mtx_);
            if (!idle_.empty()) {
                auto c = std::move(idle_.back());
                idle_.pop_back();
                return pooled_connection{this, std::move(c)};
            }
        }

        auto c = connection::open(opts_);
        if (!c) return std::unexpected(c.error());
        return pooled_connection{this, std::move(*c)};
    }

    [[nodiscard]] auto options() const noexcept -> const connection_options& { return opts_; }

    [[nodiscard]] auto idle_count() const -> std::size_t {
        std::lock_guard lock(mtx_);
        return idle_.size();
    }

    /// Closes every idle connection
    void clear() {
        std::vector<std::unique_ptr<connection>> drop;
        {
            std::lock_guard lock(mtx_);
            drop.swap(idle_);
        }
    }

private:
    friend class pooled_connection;

    void release(std::unique_ptr<connection> c) noexcept {
        if (!c || c->broken())
            return;
        std::lock_guard lock(mtx_);
        if (idle_.size() < max_idle_)
            idle_.push_back(std::move(c));
    }

    connection_options opts_;
    std::size_t        max_idle_;

    mutable std::mutex                       mtx_;
    std::vector<std::unique_ptr<connection>> idle_;
};

inline void pooled_connection::return_to_pool() noexcept {
    if (pool_ && conn_)
        pool_->release(std::move(conn_));
    pool_ = nullptr;
}

} // namespace clustermc::memcached

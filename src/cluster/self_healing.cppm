module;

#include <clustermc/config.hpp>

export module clustermc.cluster:self_healing;

import std;
import :membership_cache;
import :client_cache;
import :kv_client;
import clustermc.core.error;
import clustermc.core.log;

namespace clustermc {

/// Runs op against the cached client. On any failure, including failure to
/// build the client, both caches are invalidated and the error is returned
/// as is. Never retries: the next call starts from discovery.
///
/// Op: (kv_client&) -> std::expected<T, error>
export template <class Op>
    requires std::invocable<Op&, kv_client&>
auto run_with_self_healing(membership_cache& membership, client_cache& clients, Op&& op)
    -> std::invoke_result_t<Op&, kv_client&>
{
    using result_t = std::invoke_result_t<Op&, kv_client&>;

    auto heal = [&](const error& e) {
        membership.invalidate();
        clients.invalidate();
        logger::warn("cluster {}: operation failed, cluster state invalidated: {}",
                     membership.endpoint().to_string(), e.message());
    };

    auto client = clients.get_client();
    if (!client) {
        heal(client.error());
        return result_t{std::unexpect, std::move(client.error())};
    }

    result_t r = std::invoke(op, **client);
    if (!r)
        heal(r.error());
    return r;
}

} // namespace clustermc

/// clustermc example: auto-discovered memcached cluster
/// Discovers the nodes behind a configuration endpoint, then runs a few
/// cache operations. Pass the endpoint as argv[1] (default 127.0.0.1:11211).
/// A plain memcached server also works because ignore_cluster_errors is on.

#include <clustermc/config.hpp>

import std;
import clustermc.core;
import clustermc.cluster;

auto main(int argc, char** argv) -> int {
    logger::init("autodiscovery_demo", logger::level::debug);

    std::string location = argc > 1 ? argv[1] : "127.0.0.1:11211";

    auto cfg = clustermc::parse_backend_config({
        {"DISCOVERY_TIMEOUT", "2.5"},
        {"IGNORE_CLUSTER_ERRORS", "true"},
        {"TIMEOUT", "300"},
        {"tcp_nodelay", "true"},
        {"ketama", "true"},
    });
    if (!cfg) {
        logger::error("bad options: {}", cfg.error().message());
        return 1;
    }

    auto made = clustermc::cluster_cache::create(location, std::move(*cfg));
    if (!made) {
        logger::error("bad endpoint: {}", made.error().message());
        return 1;
    }
    auto& cache = **made;

    // 1. discovery happens on first use
    std::println("=== Discovery ===");
    auto nodes = cache.membership().get_nodes();
    if (!nodes) {
        std::println("  discovery failed: {}", nodes.error().message());
        return 1;
    }
    for (auto& n : **nodes)
        std::println("  node {}", n.to_string());

    // 2. single key
    std::println("\n=== get / set / delete ===");
    if (auto r = cache.set("demo:greeting", "hello"); !r)
        std::println("  set failed: {}", r.error().message());
    if (auto v = cache.get("demo:greeting"); v && *v)
        std::println("  demo:greeting = {}", **v);
    if (auto d = cache.remove("demo:greeting"); d)
        std::println("  deleted: {}", *d);

    // 3. batches spread over the nodes
    std::println("\n=== set_many / get_many ===");
    std::vector<std::pair<std::string, std::string>> items;
    std::vector<std::string> keys;
    for (int i = 0; i < 8; ++i) {
        items.emplace_back(std::format("demo:item:{}", i), std::format("value-{}", i));
        keys.push_back(items.back().first);
    }
    if (auto failed = cache.set_many(items); failed)
        std::println("  not stored: {}", failed->size());
    if (auto hits = cache.get_many(keys); hits)
        std::println("  hits: {}/{}", hits->size(), keys.size());

    // 4. an invalid key fails, resets cluster state, and the next call recovers
    std::println("\n=== Self-healing ===");
    auto bad = cache.get("key with spaces");
    std::println("  bad key: {}", bad ? "ok?" : bad.error().message());
    std::println("  warm after failure: {}", cache.is_warm());
    auto again = cache.get("demo:item:0");
    std::println("  recovered: {}", again.has_value());

    logger::shutdown();
    return 0;
}

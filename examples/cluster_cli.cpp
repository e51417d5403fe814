#include <clustermc/version.hpp>
#include <clustermc/config.hpp>

import std;
import clustermc.core;
import clustermc.cluster;

// =============================================================================
// cluster_cli: command line smoke tool for an auto-discovered memcached cluster
//
//   cluster_cli [-o KEY=VALUE]... [-v] <host:port> <command> [args...]
//
//   discover                 print the node list
//   get <key>                print the value, exit 1 on a miss
//   mget <key>...            print every hit as key=value
//   set <key> <value> [ttl]  store, ttl in seconds
//   delete <key>             exit 1 when the key did not exist
// =============================================================================

namespace {

void usage() {
    std::println(std::cerr,
        "usage: cluster_cli [-o KEY=VALUE]... [-v] <host:port> <command> [args...]\n"
        "commands: discover | get <key> | mget <key>... | set <key> <value> [ttl] | delete <key>");
}

auto fail(const clustermc::error& e) -> int {
    std::println(std::cerr, "error: {}", e.message());
    if (e.cause())
        std::println(std::cerr, "  cause: {}", e.cause().message());
    return 2;
}

auto run(clustermc::cluster_cache& cache, std::string_view cmd,
         std::span<const std::string> args) -> int
{
    if (cmd == "discover" && args.empty()) {
        auto cfg = cache.membership().get_config();
        if (!cfg) return fail(cfg.error());
        std::println("config version {} (engine {})",
                     (*cfg)->config_version, (*cfg)->engine_version);
        for (auto& n : (*cfg)->nodes)
            std::println("  {}", n.to_string());
        return 0;
    }
    if (cmd == "get" && args.size() == 1) {
        auto v = cache.get(args[0]);
        if (!v) return fail(v.error());
        if (!*v) return 1;
        std::println("{}", **v);
        return 0;
    }
    if (cmd == "mget" && !args.empty()) {
        auto hits = cache.get_many(args);
        if (!hits) return fail(hits.error());
        for (auto& k : args)
            if (auto it = hits->find(k); it != hits->end())
                std::println("{}={}", k, it->second);
        return 0;
    }
    if (cmd == "set" && (args.size() == 2 || args.size() == 3)) {
        std::optional<std::chrono::seconds> ttl;
        if (args.size() == 3) {
            std::int64_t secs = 0;
            auto& s = args[2];
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), secs);
            if (ec != std::errc{} || p != s.data() + s.size()) {
                std::println(std::cerr, "invalid ttl '{}'", s);
                return 2;
            }
            ttl = std::chrono::seconds(secs);
        }
        auto r = cache.set(args[0], args[1], ttl);
        if (!r) return fail(r.error());
        return *r ? 0 : 1;
    }
    if (cmd == "delete" && args.size() == 1) {
        auto r = cache.remove(args[0]);
        if (!r) return fail(r.error());
        return *r ? 0 : 1;
    }
    usage();
    return 2;
}

} // namespace

auto main(int argc, char** argv) -> int {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;
    auto lv = logger::level::warn;

    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (a == "-v") {
            lv = logger::level::debug;
        } else if (a == "-o" && i + 1 < argc) {
            std::string_view kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string_view::npos) {
                std::println(std::cerr, "option '{}' is not KEY=VALUE", kv);
                return 2;
            }
            options[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
        } else if (a == "--version") {
            std::println("cluster_cli (clustermc v{})", CLUSTERMC_VERSION_STRING);
            return 0;
        } else {
            positional.emplace_back(a);
        }
    }
    if (positional.size() < 2) {
        usage();
        return 2;
    }

    logger::init("clustermc", lv);

    auto cfg = clustermc::parse_backend_config(options);
    if (!cfg) return fail(cfg.error());

    auto cache = clustermc::cluster_cache::create(positional[0], std::move(*cfg));
    if (!cache) return fail(cache.error());

    auto args = std::span<const std::string>(positional).subspan(2);
    auto rc = run(**cache, positional[1], args);
    logger::shutdown();
    return rc;
}

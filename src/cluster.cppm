/// clustermc.cluster: auto-discovering, self-healing cluster cache
///
///   import clustermc.cluster;
///
///   auto cfg   = clustermc::parse_backend_config(options);
///   auto cache = clustermc::cluster_cache::create("cfg.example.com:11211", *cfg);

export module clustermc.cluster;

export import :types;
export import :discovery;
export import :membership_cache;
export import :kv_client;
export import :client_cache;
export import :self_healing;
export import :config;
export import :cluster_cache;

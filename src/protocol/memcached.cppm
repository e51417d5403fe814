/// clustermc.protocol.memcached: memcached text protocol client
///
///   import clustermc.protocol.memcached;
///
///   std::vector<memcached::server_address> servers{{"10.0.0.1", 11211}};
///   auto c = memcached::client::create(servers, memcached::behaviors{});
///   (*c)->set("k", "v", std::chrono::seconds(60));

export module clustermc.protocol.memcached;

export import :types;
export import :request;
export import :parser;
export import :behaviors;
export import :hashing;
export import :connection;
export import :pool;
export import :client;

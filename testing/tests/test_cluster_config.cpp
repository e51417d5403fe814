/// clustermc unit tests: endpoint parsing, configuration payload, backend options

#include "test_framework.hpp"

import std;
import clustermc.core.error;
import clustermc.protocol.memcached;
import clustermc.cluster;

using namespace clustermc;

// =============================================================================
// Endpoint / location
// =============================================================================

TEST(endpoint_parse_valid) {
    auto ep = parse_endpoint("cfg.abc123.cfg.use1.cache.amazonaws.com:11211");
    ASSERT_OK(ep);
    ASSERT_EQ(ep->host, std::string("cfg.abc123.cfg.use1.cache.amazonaws.com"));
    ASSERT_EQ(ep->port, 11211);
    ASSERT_EQ(ep->to_string(), std::string("cfg.abc123.cfg.use1.cache.amazonaws.com:11211"));

    auto spaced = parse_endpoint("  10.0.0.5:6000 ");
    ASSERT_OK(spaced);
    ASSERT_EQ(spaced->host, std::string("10.0.0.5"));
}

TEST(endpoint_parse_rejects_malformed) {
    for (auto bad : {"cfg.example.com", "cfg.example.com:", ":11211",
                     "cfg.example.com:11211:1", "cfg.example.com:0",
                     "cfg.example.com:65536", "cfg.example.com:port", "::1:11211"})
        ASSERT_ERR(parse_endpoint(bad), cluster_errc::malformed_endpoint);
}

TEST(location_split) {
    auto parts = split_location("a:1; b:2 ,c:3;");
    ASSERT_EQ(parts.size(), 3u);
    ASSERT_EQ(parts[0], std::string("a:1"));
    ASSERT_EQ(parts[1], std::string("b:2"));
    ASSERT_EQ(parts[2], std::string("c:3"));
    ASSERT_TRUE(split_location("").empty());
    ASSERT_TRUE(split_location(" ; ").empty());
}

TEST(single_endpoint_counting) {
    std::vector<std::string> none;
    std::vector<std::string> two{"a:1", "b:2"};
    std::vector<std::string> one{"a:1"};
    ASSERT_ERR(parse_single_endpoint(none), cluster_errc::no_endpoint);
    ASSERT_ERR(parse_single_endpoint(two), cluster_errc::multiple_endpoints);
    ASSERT_OK(parse_single_endpoint(one));
}

// =============================================================================
// Engine version
// =============================================================================

TEST(engine_version_parse_and_compare) {
    auto v = parse_engine_version("1.4.14");
    ASSERT_TRUE(v.has_value());
    ASSERT_EQ((*v)[0], 1u);
    ASSERT_EQ((*v)[1], 4u);
    ASSERT_EQ((*v)[2], 14u);

    ASSERT_TRUE(supports_config_command("1.4.14"));
    ASSERT_TRUE(supports_config_command("1.4.34"));
    ASSERT_TRUE(supports_config_command("1.6.6-beta"));
    ASSERT_TRUE(supports_config_command("2"));
    ASSERT_FALSE(supports_config_command("1.4.5"));
    ASSERT_FALSE(supports_config_command("1.4.13"));
    ASSERT_FALSE(supports_config_command("1.2"));
    // unknown: assume a recent engine
    ASSERT_TRUE(supports_config_command("unknown"));
}

// =============================================================================
// Configuration payload
// =============================================================================

TEST(payload_parse_typical) {
    auto cfg = parse_cluster_payload(
        "12\n"
        "myCluster.pc4ldq.0001.use1.cache.amazonaws.com|10.82.235.120|11211 "
        "myCluster.pc4ldq.0002.use1.cache.amazonaws.com|10.80.249.27|11211\n");
    ASSERT_OK(cfg);
    ASSERT_EQ(cfg->config_version, 12u);
    ASSERT_EQ(cfg->nodes.size(), 2u);
    ASSERT_EQ(cfg->nodes[0].to_string(), std::string("10.82.235.120:11211"));
    ASSERT_EQ(cfg->nodes[1].to_string(), std::string("10.80.249.27:11211"));
}

TEST(payload_uses_hostname_without_ip) {
    auto cfg = parse_cluster_payload("3\nnode-a.example||11211 node-b.example|10.0.0.2|11212\n");
    ASSERT_OK(cfg);
    ASSERT_EQ(cfg->nodes[0].host, std::string("node-a.example"));
    ASSERT_EQ(cfg->nodes[1].host, std::string("10.0.0.2"));
    ASSERT_EQ(cfg->nodes[1].port, 11212);
}

TEST(payload_permissive_whitespace) {
    auto cfg = parse_cluster_payload("\r\n7\r\n\r\n  a|10.0.0.1|11211 \t  b|10.0.0.2|11211  \r\n\r\n");
    ASSERT_OK(cfg);
    ASSERT_EQ(cfg->config_version, 7u);
    ASSERT_EQ(cfg->nodes.size(), 2u);
}

TEST(payload_rejects_structural_errors) {
    const char* bad[] = {
        "",                                         // no lines
        "12\n",                                     // no node line
        "12\na|1.2.3.4|11211\nextra\n",             // three lines
        "x12\na|1.2.3.4|11211\n",                   // bad version
        "12\na|1.2.3.4\n",                          // two fields
        "12\na|1.2.3.4|11211|x\n",                  // four fields
        "12\na|1.2.3.4|\n",                         // empty port
        "12\na|1.2.3.4|70000\n",                    // port out of range
        "12\n||11211\n",                            // no address
    };
    for (auto* b : bad)
        ASSERT_ERR(parse_cluster_payload(b), cluster_errc::malformed_config);
}

// =============================================================================
// backend options
// =============================================================================

TEST(backend_config_defaults) {
    auto cfg = parse_backend_config({});
    ASSERT_OK(cfg);
    ASSERT_FALSE(cfg->discovery_timeout.has_value());
    ASSERT_FALSE(cfg->ignore_cluster_errors);
    ASSERT_TRUE(cfg->storage == client_storage::per_instance);
    ASSERT_FALSE(cfg->default_ttl.has_value());
    ASSERT_FALSE(cfg->tls.enabled);
    ASSERT_TRUE(cfg->behaviors == memcached::behaviors{});
}

TEST(backend_config_reserved_keys) {
    auto cfg = parse_backend_config({
        {"DISCOVERY_TIMEOUT", "2.5"},
        {"IGNORE_CLUSTER_ERRORS", "yes"},
        {"CLIENT_STORAGE", "thread"},
        {"TIMEOUT", "300"},
        {"TLS_CA_FILE", "/etc/ssl/ca.pem"},
        {"TLS_SNI", "cfg.example.com"},
    });
    ASSERT_OK(cfg);
    ASSERT_EQ(cfg->discovery_timeout->count(), 2500);
    ASSERT_TRUE(cfg->ignore_cluster_errors);
    ASSERT_TRUE(cfg->storage == client_storage::per_thread);
    ASSERT_EQ(cfg->default_ttl->count(), 300);
    ASSERT_EQ(cfg->tls.ca_file, std::string("/etc/ssl/ca.pem"));
    ASSERT_EQ(cfg->tls.sni, std::string("cfg.example.com"));
}

TEST(backend_config_behaviors_passthrough) {
    auto cfg = parse_backend_config({
        {"TCP_NODELAY", "true"},
        {"ketama", "1"},
        {"Connect_Timeout", "1500"},
    });
    ASSERT_OK(cfg);
    ASSERT_TRUE(cfg->behaviors.tcp_nodelay);
    ASSERT_TRUE(cfg->behaviors.ketama);
    ASSERT_EQ(cfg->behaviors.connect_timeout.count(), 1500);
}

TEST(backend_config_timeout_none) {
    auto cfg = parse_backend_config({{"TIMEOUT", "None"}});
    ASSERT_OK(cfg);
    ASSERT_FALSE(cfg->default_ttl.has_value());
}

TEST(backend_config_rejects_bad_values) {
    using opts = std::map<std::string, std::string>;
    ASSERT_ERR(parse_backend_config(opts{{"DISCOVERY_TIMEOUT", "soon"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"DISCOVERY_TIMEOUT", "0"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"IGNORE_CLUSTER_ERRORS", "perhaps"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"CLIENT_STORAGE", "process"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"TIMEOUT", "5m"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"unknown_behavior", "1"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"hash", "sha256"}}), cluster_errc::invalid_option);
}

TEST(backend_config_caps_numeric_values) {
    using opts = std::map<std::string, std::string>;
    ASSERT_ERR(parse_backend_config(opts{{"TIMEOUT", "9223372036854775807"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"TIMEOUT", "99999999999999999999"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"TIMEOUT", "31536001"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"DISCOVERY_TIMEOUT", "1e300"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"DISCOVERY_TIMEOUT", "86400.5"}}), cluster_errc::invalid_option);
    ASSERT_ERR(parse_backend_config(opts{{"connect_timeout", "18446744073709551615"}}),
               cluster_errc::invalid_option);

    auto cfg = parse_backend_config(opts{{"TIMEOUT", "31536000"}, {"DISCOVERY_TIMEOUT", "86400"}});
    ASSERT_OK(cfg);
    ASSERT_EQ(cfg->default_ttl->count(), memcached::max_ttl.count());
    ASSERT_EQ(cfg->discovery_timeout->count(), 86'400'000);
}

TEST(backend_config_accepts_unsupported_behaviors) {
    auto cfg = parse_backend_config({{"binary", "true"}, {"_no_block", "1"},
                                     {"remove_failed", "4"}, {"dead_timeout", "60"},
                                     {"tcp_nodelay", "true"}});
    ASSERT_OK(cfg);
    ASSERT_TRUE(cfg->behaviors.tcp_nodelay);
    ASSERT_EQ(cfg->behaviors.connect_timeout.count(), 10000);
}

TEST(cluster_error_category) {
    auto ec = make_error_code(cluster_errc::cluster_unreachable);
    ASSERT_EQ(std::string(ec.category().name()), std::string("clustermc.cluster"));
    clustermc::error e{ec, "Cannot connect to cluster a:1 (refused)",
                       make_error_code(clustermc::errc::connection_refused)};
    ASSERT_TRUE(e == ec);
    ASSERT_EQ(e.message(), std::string("Cannot connect to cluster a:1 (refused)"));
    ASSERT_TRUE(e.cause() == make_error_code(clustermc::errc::connection_refused));
}

RUN_TESTS()

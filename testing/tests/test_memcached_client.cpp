/// clustermc integration tests: memcached::client pooling, error paths, routing

#include "test_framework.hpp"

import std;
import clustermc.core;
import clustermc.protocol.memcached;

#include "fake_memcached.hpp"

using namespace clustermc::memcached;
using clustermc::test::fake_memcached;

namespace {

auto quick_behaviors() -> behaviors {
    behaviors b;
    b.connect_timeout = std::chrono::milliseconds(2000);
    b.send_timeout    = std::chrono::milliseconds(2000);
    b.receive_timeout = std::chrono::milliseconds(2000);
    return b;
}

auto make_client(std::vector<server_address> servers, behaviors b = quick_behaviors())
    -> std::unique_ptr<client>
{
    auto c = client::create(servers, b);
    if (!c) throw std::runtime_error(c.error().message());
    return std::move(*c);
}

const bool quiet = [] {
    logger::init("test_memcached_client", logger::level::error);
    return true;
}();

} // namespace

// =============================================================================
// Pooling
// =============================================================================

TEST(client_reuses_pooled_connection) {
    fake_memcached srv;
    auto c = make_client({{"127.0.0.1", srv.port()}});

    ASSERT_EQ(c->set("k", "v").value(), true);
    ASSERT_EQ(c->get("k").value().value_or(""), std::string("v"));
    ASSERT_EQ(c->remove("k").value(), true);
    ASSERT_EQ(c->remove("k").value(), false);
    ASSERT_FALSE(c->get("k").value().has_value());

    ASSERT_EQ(srv.connections(), 1);
    ASSERT_EQ(c->idle_connections(0), 1u);
}

TEST(client_empty_server_list) {
    auto c = make_client({});
    ASSERT_ERR(c->get("k"), errc::no_servers);
    ASSERT_ERR(c->set("k", "v"), errc::no_servers);
    std::vector<std::string> keys{"a"};
    ASSERT_ERR(c->get_many(keys), errc::no_servers);
}

// =============================================================================
// Broken connections
// =============================================================================

TEST(client_drops_connection_after_unparsable_reply) {
    fake_memcached srv;
    auto c = make_client({{"127.0.0.1", srv.port()}});

    ASSERT_OK(c->set("k", "v"));
    ASSERT_EQ(c->idle_connections(0), 1u);

    ASSERT_ERR(c->get("garbage:1"), errc::protocol_error);
    ASSERT_EQ(c->idle_connections(0), 0u);   // not handed back

    // the next operation opens a fresh connection
    ASSERT_EQ(c->get("k").value().value_or(""), std::string("v"));
    ASSERT_EQ(srv.connections(), 2);
    ASSERT_EQ(c->idle_connections(0), 1u);
}

TEST(client_set_many_fails_when_peer_closes_mid_pipeline) {
    fake_memcached srv;
    auto c = make_client({{"127.0.0.1", srv.port()}});

    std::vector<std::pair<std::string, std::string>> items{
        {"a", "1"}, {"b", "2"}, {"drop:c", "3"}};
    ASSERT_ERR(c->set_many(items), clustermc::errc::end_of_file);
    ASSERT_EQ(c->idle_connections(0), 0u);
    // replies before the close were real
    ASSERT_EQ(srv.stored("a").value_or(""), std::string("1"));
    ASSERT_EQ(srv.stored("b").value_or(""), std::string("2"));
    ASSERT_FALSE(srv.stored("drop:c").has_value());

    std::vector<std::pair<std::string, std::string>> again{{"d", "4"}};
    auto failed = c->set_many(again);
    ASSERT_OK(failed);
    ASSERT_TRUE(failed->empty());
    ASSERT_EQ(srv.connections(), 2);
}

TEST(client_receive_timeout_on_silent_server) {
    fake_memcached srv;
    auto b = quick_behaviors();
    b.receive_timeout = std::chrono::milliseconds(200);
    auto c = make_client({{"127.0.0.1", srv.port()}}, b);

    srv.set_stalled(true);
    ASSERT_ERR(c->get("k"), clustermc::errc::connection_timed_out);
    ASSERT_EQ(c->idle_connections(0), 0u);

    srv.set_stalled(false);
    ASSERT_OK(c->set("k", "v"));
}

// =============================================================================
// Routing over two servers
// =============================================================================

TEST(client_routes_keys_to_their_server) {
    fake_memcached one;
    fake_memcached two;
    std::array<fake_memcached*, 2> fakes{&one, &two};
    auto c = make_client({{"127.0.0.1", one.port()}, {"127.0.0.1", two.port()}});

    std::vector<std::pair<std::string, std::string>> items;
    std::vector<std::string> keys;
    std::array<int, 2> per_server{};
    for (int i = 0; i < 20; ++i) {
        items.emplace_back(std::format("user:{}", i), std::format("v{}", i));
        keys.push_back(items.back().first);
    }

    for (auto& [k, v] : items) {
        ASSERT_OK(c->set(k, v));
        auto idx = c->server_for(k);
        ASSERT_OK(idx);
        ++per_server[*idx];
        ASSERT_EQ(fakes[*idx]->stored(k).value_or(""), v);
        ASSERT_FALSE(fakes[1 - *idx]->stored(k).has_value());
    }
    ASSERT_TRUE(per_server[0] > 0);
    ASSERT_TRUE(per_server[1] > 0);

    auto hits = c->get_many(keys);
    ASSERT_OK(hits);
    ASSERT_EQ(hits->size(), keys.size());
    ASSERT_EQ(hits->at("user:7"), std::string("v7"));
    // one multi-key get per server
    ASSERT_EQ(one.count("get"), 1);
    ASSERT_EQ(two.count("get"), 1);
}

TEST(client_set_many_splits_pipeline_by_server) {
    fake_memcached one;
    fake_memcached two;
    auto c = make_client({{"127.0.0.1", one.port()}, {"127.0.0.1", two.port()}});

    std::vector<std::pair<std::string, std::string>> items;
    for (int i = 0; i < 10; ++i)
        items.emplace_back(std::format("item:{}", i), std::format("{}", i));

    auto failed = c->set_many(items);
    ASSERT_OK(failed);
    ASSERT_TRUE(failed->empty());
    ASSERT_EQ(one.count("set") + two.count("set"), 10);
    ASSERT_EQ(one.connections() + two.connections(), 2);
}

RUN_TESTS()

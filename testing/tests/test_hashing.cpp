/// clustermc unit tests: key hashes and node_locator (ketama / modula)

#include "test_framework.hpp"

import std;
import clustermc.protocol.memcached;

using namespace clustermc::memcached;

// =============================================================================
// hash_key
// =============================================================================

TEST(hash_fnv1a_32_known_values) {
    ASSERT_EQ(hash_key(hash_kind::fnv1a_32, "").value(), 0x811C9DC5u);
    ASSERT_EQ(hash_key(hash_kind::fnv1a_32, "a").value(), 0xE40C292Cu);
}

TEST(hash_md5_is_first_digest_word) {
    // md5("") = d41d8cd9 8f00b204 ...
    ASSERT_EQ(hash_key(hash_kind::md5, "").value(), 0xD98C1DD4u);
}

TEST(hash_crc_known_value) {
    // crc32("hello") = 0x3610A686
    ASSERT_EQ(hash_key(hash_kind::crc, "hello").value(), 0x3610u);
}

static auto no_digest(std::string_view) -> std::optional<digest16> {
    return std::nullopt;
}

TEST(hash_md5_failure_is_reported) {
    ASSERT_ERR(hash_key(hash_kind::md5, "key", no_digest), errc::hash_unavailable);
    // non-md5 hashes never touch the digest
    ASSERT_OK(hash_key(hash_kind::fnv1a_32, "key", no_digest));
}

// =============================================================================
// node_locator
// =============================================================================

static std::vector<std::string> node_names(std::size_t n) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < n; ++i)
        out.push_back(ketama_name(std::format("10.0.0.{}", i + 1), 11211));
    return out;
}

TEST(ketama_name_omits_default_port) {
    ASSERT_EQ(ketama_name("10.0.0.1", 11211), std::string("10.0.0.1"));
    ASSERT_EQ(ketama_name("10.0.0.1", 11212), std::string("10.0.0.1:11212"));
}

static auto make_locator(std::span<const std::string> names, bool ketama, hash_kind hash)
    -> node_locator
{
    auto loc = node_locator::create(names, ketama, hash);
    if (!loc) throw std::runtime_error(loc.error().message());
    return std::move(*loc);
}

TEST(locator_single_node) {
    auto names = node_names(1);
    auto ketama = make_locator(names, true, hash_kind::md5);
    auto modula = make_locator(names, false, hash_kind::md5);
    for (int i = 0; i < 50; ++i) {
        auto key = std::format("key-{}", i);
        ASSERT_EQ(ketama.locate(key).value(), 0u);
        ASSERT_EQ(modula.locate(key).value(), 0u);
    }
}

TEST(locator_modula_matches_hash) {
    auto names = node_names(3);
    auto loc = make_locator(names, false, hash_kind::fnv1a_32);
    for (int i = 0; i < 100; ++i) {
        auto key = std::format("key-{}", i);
        ASSERT_EQ(loc.locate(key).value(), hash_key(hash_kind::fnv1a_32, key).value() % 3);
    }
}

TEST(locator_ketama_continuum_size) {
    auto names = node_names(4);
    auto loc = make_locator(names, true, hash_kind::md5);
    ASSERT_EQ(loc.size(), 4u);
    ASSERT_EQ(loc.continuum_size(), 4u * node_locator::points_per_server);
}

TEST(locator_without_md5_fails_to_build) {
    auto names = node_names(3);
    ASSERT_ERR(node_locator::create(names, true, hash_kind::md5, no_digest),
               errc::hash_unavailable);
    ASSERT_ERR(node_locator::create(names, false, hash_kind::md5, no_digest),
               errc::hash_unavailable);
    // ketama points need MD5 even when keys use another hash
    ASSERT_ERR(node_locator::create(names, true, hash_kind::fnv1a_32, no_digest),
               errc::hash_unavailable);
    ASSERT_OK(node_locator::create(names, false, hash_kind::fnv1a_32, no_digest));
}

TEST(locator_ketama_spreads_keys) {
    auto names = node_names(4);
    auto loc = make_locator(names, true, hash_kind::md5);
    std::array<int, 4> hits{};
    for (int i = 0; i < 4000; ++i)
        ++hits[loc.locate(std::format("user:{}", i)).value()];
    for (auto h : hits) {
        ASSERT_TRUE(h > 500);
        ASSERT_TRUE(h < 1500);
    }
}

TEST(locator_ketama_is_consistent_on_node_removal) {
    auto four = node_names(4);
    auto three = std::vector<std::string>(four.begin(), four.begin() + 3);
    auto before = make_locator(four, true, hash_kind::md5);
    auto after = make_locator(three, true, hash_kind::md5);

    int moved = 0;
    for (int i = 0; i < 2000; ++i) {
        auto key = std::format("session:{}", i);
        auto b = before.locate(key).value();
        auto a = after.locate(key).value();
        if (b != 3) {
            // keys of surviving nodes stay where they were
            ASSERT_EQ(a, b);
        } else {
            ++moved;
        }
    }
    ASSERT_TRUE(moved > 0);
}

RUN_TESTS()

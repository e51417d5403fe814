module;

#include <clustermc/config.hpp>
#include <openssl/evp.h>

export module clustermc.protocol.memcached:hashing;

import std;
import :types;
import :behaviors;

namespace clustermc::memcached {

// =============================================================================
// Key hashes
// =============================================================================

export using digest16 = std::array<std::uint8_t, 16>;

/// Digest used for md5 key hashes and ketama points; nullopt when the
/// digest cannot be computed
export using digest_function = std::optional<digest16> (*)(std::string_view);

/// MD5 through the EVP interface. Fails when no loaded provider offers MD5
/// (OpenSSL 3 with only the FIPS provider).
export inline auto md5_digest(std::string_view data) -> std::optional<digest16> {
    const EVP_MD* md = EVP_md5();
    if (md == nullptr) return std::nullopt;

    digest16 digest{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, md, nullptr) != 1
        || len != digest.size())
        return std::nullopt;
    return digest;
}

namespace detail {

/// Point k (0..3) of a ketama digest
constexpr auto ketama_point(const digest16& d, std::size_t k) noexcept
    -> std::uint32_t
{
    return  static_cast<std::uint32_t>(d[3 + k * 4]) << 24
          | static_cast<std::uint32_t>(d[2 + k * 4]) << 16
          | static_cast<std::uint32_t>(d[1 + k * 4]) << 8
          | static_cast<std::uint32_t>(d[0 + k * 4]);
}

/// CRC-32 (IEEE 802.3), table built on first use
inline auto crc32(std::string_view data) noexcept -> std::uint32_t {
    static const auto table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k)
                c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            t[i] = c;
        }
        return t;
    }();

    std::uint32_t crc = 0xFFFFFFFFu;
    for (char ch : data)
        crc = table[(crc ^ static_cast<std::uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
    return crc ^ 0xFFFFFFFFu;
}

} // namespace detail

export inline auto hash_key(hash_kind kind, std::string_view key,
                            digest_function md5 = md5_digest)
    -> std::expected<std::uint32_t, std::error_code>
{
    switch (kind) {
    case hash_kind::md5: {
        auto d = md5(key);
        if (!d) return std::unexpected(make_error_code(errc::hash_unavailable));
        return detail::ketama_point(*d, 0);
    }
    case hash_kind::fnv1a_32: {
        std::uint32_t h = 0x811C9DC5u;
        for (char ch : key) {
            h ^= static_cast<std::uint8_t>(ch);
            h *= 0x01000193u;
        }
        return h;
    }
    case hash_kind::crc: {
        auto h = (detail::crc32(key) >> 16) & 0x7fffu;
        return h == 0 ? 1u : h;
    }
    }
    return std::unexpected(make_error_code(errc::hash_unavailable));
}

// =============================================================================
// node_locator: key -> node index
// =============================================================================

/// Ketama continuum or plain modula over a fixed node list.
///
/// Node names are "host:port", or just "host" on the default port, which
/// keeps the ring compatible with libmemcached clients of the same cluster.
export class node_locator {
public:
    static constexpr std::size_t points_per_server = 160;

    node_locator() = default;

    /// Fails with errc::hash_unavailable when the ring or the key hash
    /// needs a digest that cannot be computed
    [[nodiscard]] static auto create(std::span<const std::string> node_names, bool ketama,
                                     hash_kind hash, digest_function md5 = md5_digest)
        -> std::expected<node_locator, std::error_code>
    {
        node_locator loc;
        loc.nodes_  = node_names.size();
        loc.ketama_ = ketama;
        loc.hash_   = hash;
        loc.md5_    = md5;

        if (hash == hash_kind::md5 && node_names.size() > 1 && !md5(""))
            return std::unexpected(make_error_code(errc::hash_unavailable));
        if (ketama) {
            if (auto r = loc.build_continuum(node_names); !r)
                return std::unexpected(r.error());
        }
        return loc;
    }

    [[nodiscard]] auto locate(std::string_view key) const
        -> std::expected<std::size_t, std::error_code>
    {
        if (nodes_ <= 1)
            return 0;

        auto h = hash_key(hash_, key, md5_);
        if (!h) return std::unexpected(h.error());

        if (!ketama_)
            return *h % nodes_;

        auto it = std::lower_bound(continuum_.begin(), continuum_.end(), *h,
            [](const point& p, std::uint32_t v) { return p.value < v; });
        if (it == continuum_.end())
            it = continuum_.begin();
        return it->index;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_; }
    [[nodiscard]] auto continuum_size() const noexcept -> std::size_t { return continuum_.size(); }

private:
    struct point {
        std::uint32_t value;
        std::size_t   index;
    };

    auto build_continuum(std::span<const std::string> names)
        -> std::expected<void, std::error_code>
    {
        continuum_.reserve(names.size() * points_per_server);
        for (std::size_t idx = 0; idx < names.size(); ++idx) {
            // each digest yields four points
            for (std::size_t i = 0; i < points_per_server / 4; ++i) {
                auto digest = md5_(std::format("{}-{}", names[idx], i));
                if (!digest) return std::unexpected(make_error_code(errc::hash_unavailable));
                for (std::size_t k = 0; k < 4; ++k)
                    continuum_.push_back({detail::ketama_point(*digest, k), idx});
            }
        }
        std::sort(continuum_.begin(), continuum_.end(),
            [](const point& a, const point& b) {
                return a.value < b.value || (a.value == b.value && a.index < b.index);
            });
        return {};
    }

    std::size_t        nodes_  = 0;
    bool               ketama_ = false;
    hash_kind          hash_   = hash_kind::md5;
    digest_function    md5_    = md5_digest;
    std::vector<point> continuum_;
};

export inline auto ketama_name(std::string_view host, std::uint16_t port,
                               std::uint16_t default_port = 11211) -> std::string {
    if (port == default_port)
        return std::string(host);
    return std::format("{}:{}", host, port);
}

} // namespace clustermc::memcached

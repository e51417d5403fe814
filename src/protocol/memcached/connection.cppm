module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:connection;

import std;
import :types;
import :request;
import :parser;
import clustermc.core.error;
import clustermc.core.buffer;
import clustermc.core.address;
import clustermc.core.socket;
import clustermc.core.dns;
#ifdef CLUSTERMC_HAS_SSL
import clustermc.core.ssl;
#endif

namespace clustermc::memcached {

// =============================================================================
// TLS settings
// =============================================================================

export struct tls_options {
    bool        enabled = false;
    bool        verify  = true;
    std::string ca_file;         // empty = system trust store
    std::string sni;             // empty = connect host

    friend auto operator==(const tls_options&, const tls_options&) -> bool = default;
};

#ifdef CLUSTERMC_HAS_SSL

/// One client context per tls_options, shared by every connection built from it
export inline auto make_tls_context(const tls_options& opts)
    -> std::expected<std::shared_ptr<ssl_context>, error>
{
    auto ctx = ssl_context::client();
    if (!ctx)
        return std::unexpected(error{ctx.error(), "cannot create TLS context"});

    if (!opts.ca_file.empty()) {
        if (auto r = ctx->load_ca_file(opts.ca_file); !r)
            return std::unexpected(error{r.error(),
                std::format("cannot load CA file '{}'", opts.ca_file)});
    } else if (opts.verify) {
        if (auto r = ctx->set_default_ca(); !r)
            return std::unexpected(error{r.error(), "cannot load system CA store"});
    }
    ctx->set_verify_peer(opts.verify);
    return std::make_shared<ssl_context>(std::move(*ctx));
}

#endif

// =============================================================================
// connection_options
// =============================================================================

export struct connection_options {
    std::string   host;
    std::uint16_t port = CLUSTERMC_DEFAULT_PORT;

    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
    std::chrono::milliseconds send_timeout    = std::chrono::seconds(10);
    std::chrono::milliseconds receive_timeout = std::chrono::seconds(10);

    bool no_delay = false;

#ifdef CLUSTERMC_HAS_SSL
    std::shared_ptr<ssl_context> tls;   // null = plain TCP
    std::string                  tls_sni;
#endif
};

// =============================================================================
// connection: one blocking text-protocol connection
// =============================================================================

/// Every call is bounded by the options' timeouts. Any I/O or parse error
/// marks the connection broken; a broken connection must not be reused.
export class connection {
    struct private_tag {};

public:
    connection(private_tag, const connection_options& opts, socket sock)
        : opts_(opts), sock_(std::move(sock)) {}

    ~connection() {
#ifdef CLUSTERMC_HAS_SSL
        if (tls_ && !broken_)
            tls_->shutdown(std::chrono::milliseconds(100));
#endif
    }

    connection(const connection&) = delete;
    auto operator=(const connection&) -> connection& = delete;

    /// Resolves host and tries each address in turn
    [[nodiscard]] static auto open(const connection_options& opts)
        -> std::expected<std::unique_ptr<connection>, error>
    {
        auto addrs = resolve(opts.host);
        if (!addrs)
            return std::unexpected(error{addrs.error(),
                std::format("cannot resolve '{}': {}", opts.host, addrs.error().message())});

        std::error_code last;
        for (auto& addr : *addrs) {
            auto family = addr.is_v4() ? address_family::ipv4 : address_family::ipv6;
            auto sock = socket::create(family);
            if (!sock) { last = sock.error(); continue; }

            if (auto r = sock->apply_options({.no_delay = opts.no_delay}); !r) {
                last = r.error();
                continue;
            }
            if (auto r = sock->connect(endpoint{addr, opts.port}, opts.connect_timeout); !r) {
                last = r.error();
                continue;
            }

            auto conn = std::make_unique<connection>(private_tag{}, opts, std::move(*sock));
#ifdef CLUSTERMC_HAS_SSL
            if (opts.tls) {
                if (auto r = conn->start_tls(*opts.tls); !r)
                    return std::unexpected(r.error());
            }
#endif
            return conn;
        }

        return std::unexpected(error{last,
            std::format("cannot connect to {}:{}: {}", opts.host, opts.port, last.message())});
    }

    [[nodiscard]] auto send(std::string_view data) -> std::expected<void, error> {
        std::expected<void, std::error_code> r;
#ifdef CLUSTERMC_HAS_SSL
        if (tls_)
            r = tls_->write_all(buffer(data), opts_.send_timeout);
        else
#endif
            r = sock_.send_all(buffer(data), opts_.send_timeout);

        if (!r) {
            broken_ = true;
            return std::unexpected(error{r.error(),
                std::format("send to {} failed: {}", remote(), r.error().message())});
        }
        return {};
    }

    [[nodiscard]] auto send(const request& req) -> std::expected<void, error> {
        return send(req.payload());
    }

    /// Next complete reply
    [[nodiscard]] auto read_reply() -> std::expected<reply, error> {
        for (;;) {
            std::error_code ec;
            auto r = parser_.consume(rbuf_, ec);
            if (ec) {
                broken_ = true;
                return std::unexpected(error{ec,
                    std::format("malformed reply from {}", remote())});
            }
            if (r) {
                rbuf_.erase(0, parser_.consumed());
                parser_.reset();
                return std::move(*r);
            }
            if (auto f = fill(); !f)
                return std::unexpected(f.error());
        }
    }

    [[nodiscard]] auto broken() const noexcept -> bool { return broken_; }
    void mark_broken() noexcept { broken_ = true; }

    /// "host:port" as configured
    [[nodiscard]] auto remote() const -> std::string {
        return std::format("{}:{}", opts_.host, opts_.port);
    }

private:
#ifdef CLUSTERMC_HAS_SSL
    auto start_tls(ssl_context& ctx) -> std::expected<void, error> {
        tls_ = std::make_unique<ssl_stream>(ctx, sock_);
        tls_->set_hostname(opts_.tls_sni.empty() ? opts_.host : opts_.tls_sni);
        if (auto r = tls_->handshake(opts_.connect_timeout); !r) {
            broken_ = true;
            return std::unexpected(error{r.error(),
                std::format("TLS handshake with {} failed: {}", remote(), r.error().message())});
        }
        return {};
    }
#endif

    auto fill() -> std::expected<void, error> {
        std::array<std::byte, 4096> tmp{};
        std::expected<std::size_t, std::error_code> n;
#ifdef CLUSTERMC_HAS_SSL
        if (tls_)
            n = tls_->read(buffer(tmp), opts_.receive_timeout);
        else
#endif
            n = sock_.receive(buffer(tmp), opts_.receive_timeout);

        if (!n) {
            broken_ = true;
            return std::unexpected(error{n.error(),
                std::format("receive from {} failed: {}", remote(), n.error().message())});
        }
        if (*n == 0) {
            broken_ = true;
            return std::unexpected(error{make_error_code(clustermc::errc::end_of_file),
                std::format("connection closed by {}", remote())});
        }
        rbuf_.append(reinterpret_cast<const char*>(tmp.data()), *n);
        return {};
    }

    connection_options opts_;
    socket             sock_;
#ifdef CLUSTERMC_HAS_SSL
    std::unique_ptr<ssl_stream> tls_;
#endif
    std::string  rbuf_;
    reply_parser parser_;
    bool         broken_ = false;
};

} // namespace clustermc::memcached

module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_HAS_SSL
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#endif

export module clustermc.core.ssl;

import std;
import clustermc.core.error;
import clustermc.core.buffer;
import clustermc.core.socket;

namespace clustermc {

#ifdef CLUSTERMC_HAS_SSL

namespace detail {

inline void ssl_global_init() noexcept {
    static bool done = [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        return true;
    }();
    (void)done;
}

// =============================================================================
// ssl_error_category: OpenSSL error queue -> std::error_code
// =============================================================================

class ssl_error_category_impl : public std::error_category {
public:
    auto name() const noexcept -> const char* override {
        return "openssl";
    }
    auto message(int ev) const -> std::string override {
        if (ev == 0) return "success";
        char buf[256]{};
        ERR_error_string_n(static_cast<unsigned long>(ev), buf, sizeof(buf));
        return buf;
    }
};

inline auto ssl_category() -> const std::error_category& {
    static const ssl_error_category_impl instance;
    return instance;
}

} // namespace detail

/// Pops the oldest entry of the thread's OpenSSL error queue
export inline auto make_ssl_error() -> std::error_code {
    auto e = ERR_get_error();
    if (e == 0) return {};
    return {static_cast<int>(e), detail::ssl_category()};
}

/// From an SSL_get_error result. WANT_READ / WANT_WRITE never reach here.
export inline auto make_ssl_error(int ssl_err) -> std::error_code {
    auto e = ERR_get_error();
    if (e != 0)
        return {static_cast<int>(e), detail::ssl_category()};
    if (ssl_err == SSL_ERROR_SYSCALL)
        return make_error_code(errc::connection_reset);
    return {ssl_err, detail::ssl_category()};
}

// =============================================================================
// ssl_context: RAII over SSL_CTX (client side only)
// =============================================================================

export class ssl_context {
public:
    ~ssl_context() {
        if (ctx_) SSL_CTX_free(ctx_);
    }

    ssl_context(const ssl_context&) = delete;
    auto operator=(const ssl_context&) -> ssl_context& = delete;

    ssl_context(ssl_context&& o) noexcept : ctx_(std::exchange(o.ctx_, nullptr)) {}
    auto operator=(ssl_context&& o) noexcept -> ssl_context& {
        if (this != &o) {
            if (ctx_) SSL_CTX_free(ctx_);
            ctx_ = std::exchange(o.ctx_, nullptr);
        }
        return *this;
    }

    /// TLS 1.2+ client context
    [[nodiscard]] static auto client() -> std::expected<ssl_context, std::error_code> {
        detail::ssl_global_init();
        auto* ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) return std::unexpected(make_ssl_error());
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
        return ssl_context{ctx};
    }

    /// PEM bundle of trusted CAs
    [[nodiscard]] auto load_ca_file(std::string_view path)
        -> std::expected<void, std::error_code>
    {
        std::string p(path);
        if (SSL_CTX_load_verify_locations(ctx_, p.c_str(), nullptr) != 1)
            return std::unexpected(make_ssl_error());
        return {};
    }

    /// System trust store
    [[nodiscard]] auto set_default_ca()
        -> std::expected<void, std::error_code>
    {
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
            return std::unexpected(make_ssl_error());
        return {};
    }

    void set_verify_peer(bool verify) noexcept {
        SSL_CTX_set_verify(ctx_,
            verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE,
            nullptr);
    }

    [[nodiscard]] auto native() const noexcept -> SSL_CTX* { return ctx_; }

private:
    explicit ssl_context(SSL_CTX* ctx) noexcept : ctx_(ctx) {}
    SSL_CTX* ctx_ = nullptr;
};

// =============================================================================
// ssl_stream: memory-BIO TLS over a connected clustermc::socket
// =============================================================================

/// OpenSSL never touches the descriptor: ciphertext is pumped between the
/// BIO pair and the socket by flush_wbio / fill_rbio, so the socket keeps
/// its poll() deadlines.
///
/// The socket must outlive the stream.
export class ssl_stream {
public:
    ssl_stream(ssl_context& ssl_ctx, socket& sock)
        : sock_(&sock)
    {
        ssl_ = SSL_new(ssl_ctx.native());
        rbio_ = BIO_new(BIO_s_mem());
        wbio_ = BIO_new(BIO_s_mem());
        // SSL takes ownership of both BIOs
        SSL_set_bio(ssl_, rbio_, wbio_);
        SSL_set_connect_state(ssl_);
    }

    ~ssl_stream() {
        if (ssl_) SSL_free(ssl_);
    }

    ssl_stream(const ssl_stream&) = delete;
    auto operator=(const ssl_stream&) -> ssl_stream& = delete;

    ssl_stream(ssl_stream&& o) noexcept
        : sock_(o.sock_)
        , ssl_(std::exchange(o.ssl_, nullptr))
        , rbio_(std::exchange(o.rbio_, nullptr))
        , wbio_(std::exchange(o.wbio_, nullptr))
    {}

    /// SNI + certificate host check. Call before handshake().
    void set_hostname(std::string_view hostname) {
        std::string h(hostname);
        SSL_set_tlsext_host_name(ssl_, h.c_str());
        auto* param = SSL_get0_param(ssl_);
        X509_VERIFY_PARAM_set1_host(param, h.c_str(), h.size());
    }

    [[nodiscard]] auto handshake(std::chrono::milliseconds timeout)
        -> std::expected<void, std::error_code>
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            int ret = SSL_do_handshake(ssl_);
            if (ret == 1)
                return flush_wbio(deadline);

            auto r = pump(SSL_get_error(ssl_, ret), deadline);
            if (!r) return std::unexpected(r.error());
        }
    }

    /// Decrypted bytes; 0 after the peer's close_notify
    [[nodiscard]] auto read(mutable_buffer buf, std::chrono::milliseconds timeout)
        -> std::expected<std::size_t, std::error_code>
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            int ret = SSL_read(ssl_, buf.data, static_cast<int>(buf.size));
            if (ret > 0)
                return static_cast<std::size_t>(ret);

            int err = SSL_get_error(ssl_, ret);
            if (err == SSL_ERROR_ZERO_RETURN)
                return std::size_t{0};
            auto r = pump(err, deadline);
            if (!r) return std::unexpected(r.error());
        }
    }

    [[nodiscard]] auto write_all(const_buffer buf, std::chrono::milliseconds timeout)
        -> std::expected<void, std::error_code>
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (buf.size > 0) {
            int ret = SSL_write(ssl_, buf.data, static_cast<int>(buf.size));
            if (ret > 0) {
                buf = buf.advanced(static_cast<std::size_t>(ret));
                auto fr = flush_wbio(deadline);
                if (!fr) return std::unexpected(fr.error());
                continue;
            }
            auto r = pump(SSL_get_error(ssl_, ret), deadline);
            if (!r) return std::unexpected(r.error());
        }
        return {};
    }

    /// Sends close_notify without waiting for the peer's
    void shutdown(std::chrono::milliseconds timeout) noexcept {
        if (!ssl_) return;
        if (SSL_shutdown(ssl_) >= 0) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            (void)flush_wbio(deadline);
        }
        ERR_clear_error();
    }

    [[nodiscard]] auto native() const noexcept -> SSL* { return ssl_; }

private:
    using clock = std::chrono::steady_clock;

    static auto remaining(clock::time_point deadline) noexcept
        -> std::chrono::milliseconds
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    /// Moves ciphertext in whichever direction OpenSSL asked for
    auto pump(int ssl_err, clock::time_point deadline)
        -> std::expected<void, std::error_code>
    {
        switch (ssl_err) {
        case SSL_ERROR_WANT_WRITE:
            return flush_wbio(deadline);
        case SSL_ERROR_WANT_READ: {
            auto fr = flush_wbio(deadline);
            if (!fr) return fr;
            return fill_rbio(deadline);
        }
        default:
            return std::unexpected(make_ssl_error(ssl_err));
        }
    }

    auto flush_wbio(clock::time_point deadline)
        -> std::expected<void, std::error_code>
    {
        char tmp[8192];
        for (;;) {
            auto pending = static_cast<int>(BIO_ctrl_pending(wbio_));
            if (pending <= 0) break;

            int n = BIO_read(wbio_, tmp, std::min(pending, static_cast<int>(sizeof(tmp))));
            if (n <= 0) break;

            auto w = sock_->send_all(const_buffer{tmp, static_cast<std::size_t>(n)},
                                     remaining(deadline));
            if (!w) return std::unexpected(w.error());
        }
        return {};
    }

    auto fill_rbio(clock::time_point deadline)
        -> std::expected<void, std::error_code>
    {
        std::array<std::byte, 8192> tmp{};
        auto r = sock_->receive(buffer(tmp), remaining(deadline));
        if (!r) return std::unexpected(r.error());
        if (*r == 0)
            return std::unexpected(make_error_code(errc::connection_reset));
        BIO_write(rbio_, tmp.data(), static_cast<int>(*r));
        return {};
    }

    socket* sock_ = nullptr;
    SSL*    ssl_  = nullptr;
    BIO*    rbio_ = nullptr;  // network -> SSL
    BIO*    wbio_ = nullptr;  // SSL -> network
};

#endif // CLUSTERMC_HAS_SSL

} // namespace clustermc

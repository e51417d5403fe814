#pragma once

/// Loopback memcached / cluster configuration endpoint for tests.
///
/// Include after `import std;` and `import clustermc.core;`.
///
///   fake_memcached srv;                           // listens on 127.0.0.1:<ephemeral>
///   srv.set_cluster_payload(srv.self_payload(7));
///   // clients connect to srv.endpoint()
///
/// Speaks: version, config get cluster, get (including the legacy
/// AmazonElastiCache:cluster key), set, delete. One thread per connection.
///
/// Misbehaviour on demand:
///   get of a "garbage:" key    -> an unparsable reply line
///   set of a "drop:" key       -> replies so far are sent, then the
///                                 connection is closed
///   set_stalled(true)          -> requests are read but never answered

namespace clustermc::test {

class fake_memcached {
public:
    fake_memcached() {
        auto s = clustermc::socket::create(clustermc::address_family::ipv4);
        if (!s) throw std::runtime_error("fake_memcached: socket");
        listener_ = std::move(*s);
        if (!listener_.apply_options({.reuse_address = true}) ||
            !listener_.bind(clustermc::endpoint{clustermc::ip_address::loopback_v4(), 0}) ||
            !listener_.listen())
            throw std::runtime_error("fake_memcached: bind/listen");
        auto ep = listener_.local_endpoint();
        if (!ep) throw std::runtime_error("fake_memcached: local_endpoint");
        port_ = ep->port;

        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~fake_memcached() { stop(); }

    fake_memcached(const fake_memcached&) = delete;
    auto operator=(const fake_memcached&) -> fake_memcached& = delete;

    void stop() {
        if (stopped_.exchange(true)) return;
        if (acceptor_.joinable()) acceptor_.join();
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mtx_);
            workers.swap(workers_);
        }
        for (auto& t : workers)
            if (t.joinable()) t.join();
        listener_.close();
    }

    [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_; }

    [[nodiscard]] auto endpoint() const -> std::string {
        return std::format("127.0.0.1:{}", port_);
    }

    /// Payload naming this server as the single node
    [[nodiscard]] auto self_payload(std::uint64_t version) const -> std::string {
        return std::format("{}\nlocalhost|127.0.0.1|{}\n", version, port_);
    }

    /// nullopt: answer ERROR to `config get cluster` (plain memcached)
    void set_cluster_payload(std::optional<std::string> payload) {
        std::lock_guard lock(mtx_);
        payload_ = std::move(payload);
    }

    void set_stalled(bool stalled) { stalled_ = stalled; }

    void set_version(std::string v) {
        std::lock_guard lock(mtx_);
        version_ = std::move(v);
    }

    /// Command name -> times received ("config", "get", "set", ...)
    [[nodiscard]] auto count(const std::string& command) const -> int {
        std::lock_guard lock(mtx_);
        auto it = counts_.find(command);
        return it == counts_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto connections() const -> int { return connections_.load(); }

    [[nodiscard]] auto stored(const std::string& key) const -> std::optional<std::string> {
        std::lock_guard lock(mtx_);
        auto it = store_.find(key);
        if (it == store_.end()) return std::nullopt;
        return it->second;
    }

private:
    void accept_loop() {
        while (!stopped_) {
            auto peer = listener_.accept(std::chrono::milliseconds(50));
            if (!peer) continue;
            ++connections_;
            std::lock_guard lock(mtx_);
            workers_.emplace_back([this, s = std::move(*peer)]() mutable { serve(s); });
        }
    }

    void serve(clustermc::socket& s) {
        std::string buf;
        std::array<std::byte, 4096> tmp{};
        while (!stopped_) {
            auto n = s.receive(clustermc::buffer(tmp), std::chrono::milliseconds(50));
            if (!n) {
                if (n.error() == make_error_code(clustermc::errc::connection_timed_out)) continue;
                return;
            }
            if (*n == 0) return;
            buf.append(reinterpret_cast<const char*>(tmp.data()), *n);

            if (stalled_) {
                buf.clear();
                continue;
            }

            std::string out;
            bool close = false;
            while (!close) {
                auto consumed = handle_one(buf, out, close);
                if (consumed == 0) break;
                buf.erase(0, consumed);
            }
            if (!out.empty() && !s.send_all(clustermc::buffer(std::string_view{out}),
                                            std::chrono::seconds(1)))
                return;
            if (close) return;
        }
    }

    /// Bytes consumed from buf, 0 when the command is incomplete
    auto handle_one(const std::string& buf, std::string& out, bool& close) -> std::size_t {
        auto crlf = buf.find("\r\n");
        if (crlf == std::string::npos) return 0;

        std::vector<std::string> tok;
        std::istringstream line(buf.substr(0, crlf));
        for (std::string t; line >> t;) tok.push_back(t);
        std::size_t used = crlf + 2;
        if (tok.empty()) return used;

        std::lock_guard lock(mtx_);
        auto& cmd = tok[0];

        if (cmd == "version") {
            ++counts_["version"];
            out += std::format("VERSION {}\r\n", version_);
        }
        else if (cmd == "config" && tok.size() == 3 && tok[1] == "get" && tok[2] == "cluster") {
            ++counts_["config"];
            if (payload_)
                out += std::format("CONFIG cluster 0 {}\r\n{}\r\nEND\r\n", payload_->size(), *payload_);
            else
                out += "ERROR\r\n";
        }
        else if (cmd == "get" && tok.size() >= 2) {
            ++counts_["get"];
            for (std::size_t i = 1; i < tok.size(); ++i) {
                if (tok[i] == "AmazonElastiCache:cluster") {
                    ++counts_["legacy"];
                    if (payload_)
                        out += std::format("VALUE {} 0 {}\r\n{}\r\n", tok[i], payload_->size(), *payload_);
                    continue;
                }
                if (tok[i].starts_with("garbage:")) {
                    out += "WHAT IS THIS\r\n";
                    return used;
                }
                if (auto it = store_.find(tok[i]); it != store_.end())
                    out += std::format("VALUE {} 0 {}\r\n{}\r\n", tok[i], it->second.size(), it->second);
            }
            out += "END\r\n";
        }
        else if (cmd == "set" && tok.size() == 5) {
            std::size_t bytes = std::stoul(tok[4]);
            if (buf.size() < used + bytes + 2) return 0;
            ++counts_["set"];
            if (tok[1].starts_with("drop:")) {
                close = true;
                return used + bytes + 2;
            }
            store_[tok[1]] = buf.substr(used, bytes);
            used += bytes + 2;
            out += "STORED\r\n";
        }
        else if (cmd == "delete" && tok.size() == 2) {
            ++counts_["delete"];
            out += store_.erase(tok[1]) ? "DELETED\r\n" : "NOT_FOUND\r\n";
        }
        else {
            out += "ERROR\r\n";
        }
        return used;
    }

    clustermc::socket listener_;
    std::uint16_t     port_ = 0;
    std::atomic<bool> stopped_{false};
    std::atomic<bool> stalled_{false};
    std::atomic<int>  connections_{0};
    std::thread       acceptor_;

    mutable std::mutex                 mtx_;
    std::vector<std::thread>           workers_;
    std::optional<std::string>         payload_;
    std::string                        version_ = "1.6.12";
    std::map<std::string, int>         counts_;
    std::map<std::string, std::string> store_;
};

/// A loopback port with nothing listening on it
inline auto closed_port() -> std::uint16_t {
    auto s = clustermc::socket::create(clustermc::address_family::ipv4);
    if (!s || !s->bind(clustermc::endpoint{clustermc::ip_address::loopback_v4(), 0}))
        throw std::runtime_error("closed_port: bind");
    auto ep = s->local_endpoint();
    if (!ep) throw std::runtime_error("closed_port: local_endpoint");
    return ep->port;   // socket closes here, nothing listens afterwards
}

} // namespace clustermc::test

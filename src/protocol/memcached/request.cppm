module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:request;

import std;
import :types;

namespace clustermc::memcached {

// =============================================================================
// request: text protocol commands, pipelined
// =============================================================================

/// One or more commands written back to back. Each command produces exactly
/// one reply sequence (a get: zero or more VALUE blocks terminated by END).
///
/// Keys are not validated here; callers run validate_key() first.
///
///   request req;
///   req.push_set("a", "1", 0, 0);
///   req.push_set("b", "2", 0, 0);
///   conn.send(req.payload());   // then read req.size() replies
export class request {
public:
    request() = default;

    /// get <key>*
    void push_get(std::span<const std::string_view> keys) {
        payload_ += "get";
        for (auto k : keys) {
            payload_ += ' ';
            payload_.append(k);
        }
        payload_ += "\r\n";
        ++commands_;
    }

    void push_get(std::string_view key) {
        push_get(std::span<const std::string_view>(&key, 1));
    }

    /// set <key> <flags> <exptime> <bytes>\r\n<data>\r\n
    void push_set(std::string_view key, std::string_view value,
                  std::uint32_t flags, std::int64_t exptime) {
        std::format_to(std::back_inserter(payload_), "set {} {} {} {}\r\n",
                       key, flags, exptime, value.size());
        payload_.append(value);
        payload_ += "\r\n";
        ++commands_;
    }

    /// delete <key>
    void push_delete(std::string_view key) {
        std::format_to(std::back_inserter(payload_), "delete {}\r\n", key);
        ++commands_;
    }

    void push_version() {
        payload_ += "version\r\n";
        ++commands_;
    }

    /// Cluster configuration, engine 1.4.14 and later
    void push_config_get_cluster() {
        payload_ += "config get cluster\r\n";
        ++commands_;
    }

    /// Cluster configuration, engines before 1.4.14
    void push_legacy_config_get() {
        payload_ += "get AmazonElastiCache:cluster\r\n";
        ++commands_;
    }

    [[nodiscard]] auto payload() const noexcept -> std::string_view { return payload_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return commands_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return commands_ == 0; }

    void clear() {
        payload_.clear();
        commands_ = 0;
    }

private:
    std::string payload_;
    std::size_t commands_ = 0;
};

} // namespace clustermc::memcached

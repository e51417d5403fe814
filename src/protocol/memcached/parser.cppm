module;

#include <clustermc/config.hpp>

export module clustermc.protocol.memcached:parser;

import std;
import :types;

namespace clustermc::memcached {

namespace detail {

inline auto split_tokens(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && line[i] == ' ') ++i;
        auto start = i;
        while (i < line.size() && line[i] != ' ') ++i;
        if (i > start) out.push_back(line.substr(start, i - start));
    }
    return out;
}

template <class T>
inline auto parse_number(std::string_view s, T& out) noexcept -> bool {
    if (s.empty()) return false;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && p == s.data() + s.size();
}

/// Text after the first token ("SERVER_ERROR out of memory" -> "out of memory")
inline auto rest_of_line(std::string_view line) -> std::string_view {
    auto sp = line.find(' ');
    if (sp == std::string_view::npos) return {};
    auto rest = line.substr(sp + 1);
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    return rest;
}

} // namespace detail

// =============================================================================
// reply_parser: incremental text protocol parser
// =============================================================================

/// Parses one reply at a time from a growing receive buffer.
///
/// A VALUE / CONFIG header is only committed together with its data block,
/// so nothing is consumed until a whole reply is available.
///
///   reply_parser p;
///   std::error_code ec;
///   auto r = p.consume(buf, ec);
///   if (ec) ...                       // malformed, drop the connection
///   else if (!r) ...                  // read more into buf, retry
///   else buf.erase(0, p.consumed()), p.reset();
export class reply_parser {
public:
    static constexpr std::string_view sep = "\r\n";

    /// Upper bound on a single data block
    static constexpr std::size_t max_block_size = 64 * 1024 * 1024;

    [[nodiscard]] auto consume(std::string_view data, std::error_code& ec)
        -> std::optional<reply>
    {
        auto remaining = data.substr(consumed_);
        auto crlf = remaining.find(sep);
        if (crlf == std::string_view::npos) {
            if (remaining.size() > max_line_length)
                ec = make_error_code(errc::protocol_error);
            return std::nullopt;
        }

        auto line = remaining.substr(0, crlf);
        auto tokens = detail::split_tokens(line);
        if (tokens.empty()) {
            ec = make_error_code(errc::protocol_error);
            return std::nullopt;
        }

        auto head = tokens[0];
        reply r;

        if (head == "VALUE" || head == "CONFIG") {
            // VALUE <key> <flags> <bytes> [<cas unique>]
            bool is_value = head == "VALUE";
            if (tokens.size() != 4 && !(is_value && tokens.size() == 5)) {
                ec = make_error_code(errc::protocol_error);
                return std::nullopt;
            }
            std::size_t bytes = 0;
            if (!detail::parse_number(tokens[2], r.flags) ||
                !detail::parse_number(tokens[3], bytes) ||
                bytes > max_block_size) {
                ec = make_error_code(errc::protocol_error);
                return std::nullopt;
            }

            auto block = remaining.substr(crlf + sep.size());
            if (block.size() < bytes + sep.size())
                return std::nullopt;  // need more data
            if (block.substr(bytes, sep.size()) != sep) {
                ec = make_error_code(errc::protocol_error);
                return std::nullopt;
            }

            r.kind = is_value ? reply_kind::value : reply_kind::config;
            r.key  = std::string(tokens[1]);
            r.data = std::string(block.substr(0, bytes));
            consumed_ += crlf + sep.size() + bytes + sep.size();
            return r;
        }

        if (head == "END")             r.kind = reply_kind::end;
        else if (head == "STORED")     r.kind = reply_kind::stored;
        else if (head == "NOT_STORED") r.kind = reply_kind::not_stored;
        else if (head == "EXISTS")     r.kind = reply_kind::exists;
        else if (head == "NOT_FOUND")  r.kind = reply_kind::not_found;
        else if (head == "DELETED")    r.kind = reply_kind::deleted;
        else if (head == "VERSION") {
            r.kind = reply_kind::version;
            r.data = std::string(detail::rest_of_line(line));
        }
        else if (head == "ERROR") {
            r.kind = reply_kind::error;
            r.data = std::string(detail::rest_of_line(line));
        }
        else if (head == "CLIENT_ERROR") {
            r.kind = reply_kind::client_error;
            r.data = std::string(detail::rest_of_line(line));
        }
        else if (head == "SERVER_ERROR") {
            r.kind = reply_kind::server_error;
            r.data = std::string(detail::rest_of_line(line));
        }
        else {
            ec = make_error_code(errc::protocol_error);
            return std::nullopt;
        }

        consumed_ += crlf + sep.size();
        return r;
    }

    /// Bytes of input covered by the replies returned so far
    [[nodiscard]] auto consumed() const noexcept -> std::size_t { return consumed_; }

    void reset() noexcept { consumed_ = 0; }

private:
    /// A status line never comes close to this
    static constexpr std::size_t max_line_length = 8192;

    std::size_t consumed_ = 0;
};

} // namespace clustermc::memcached

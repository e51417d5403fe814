module;

#include <clustermc/config.hpp>

export module clustermc.cluster:types;

import std;
import clustermc.core.error;

namespace clustermc {

// =============================================================================
// Cluster error codes
// =============================================================================

export enum class cluster_errc {
    success = 0,

    // Construction
    no_endpoint,            // location list is empty
    multiple_endpoints,     // more than one configuration endpoint
    malformed_endpoint,     // not "host:port"
    invalid_option,         // unknown option or unparsable value

    // Discovery
    cluster_unreachable,    // configuration endpoint cannot be reached
    malformed_config,       // configuration payload does not parse
};

namespace detail {

class cluster_error_category_impl : public std::error_category {
public:
    auto name() const noexcept -> const char* override { return "clustermc.cluster"; }
    auto message(int ev) const -> std::string override {
        switch (static_cast<cluster_errc>(ev)) {
            case cluster_errc::success:             return "success";
            case cluster_errc::no_endpoint:         return "no configuration endpoint";
            case cluster_errc::multiple_endpoints:  return "only one configuration endpoint is supported";
            case cluster_errc::malformed_endpoint:  return "configuration endpoint must be host:port";
            case cluster_errc::invalid_option:      return "invalid option";
            case cluster_errc::cluster_unreachable: return "cannot connect to cluster";
            case cluster_errc::malformed_config:    return "malformed cluster configuration";
            default:                                return "unrecognized cluster error";
        }
    }
};

inline auto cluster_category_instance() -> const std::error_category& {
    static const cluster_error_category_impl instance;
    return instance;
}

} // namespace detail

export inline auto cluster_category() noexcept -> const std::error_category& {
    return detail::cluster_category_instance();
}

export inline auto make_error_code(cluster_errc e) noexcept -> std::error_code {
    return {static_cast<int>(e), detail::cluster_category_instance()};
}

// =============================================================================
// Addresses
// =============================================================================

/// The single host:port the cluster is discovered through
export struct configuration_endpoint {
    std::string   host;
    std::uint16_t port = CLUSTERMC_DEFAULT_PORT;

    [[nodiscard]] auto to_string() const -> std::string {
        return std::format("{}:{}", host, port);
    }

    friend auto operator==(const configuration_endpoint&, const configuration_endpoint&) -> bool = default;
};

export struct node_address {
    std::string   host;
    std::uint16_t port = CLUSTERMC_DEFAULT_PORT;

    [[nodiscard]] auto to_string() const -> std::string {
        return std::format("{}:{}", host, port);
    }

    friend auto operator==(const node_address&, const node_address&) -> bool = default;
};

/// Endpoint order
export using node_list = std::vector<node_address>;

/// One discovery result
export struct cluster_config {
    std::uint64_t config_version = 0;   // bumped by the endpoint on every change
    std::string   engine_version;       // "1.6.12", empty when unknown
    node_list     nodes;
};

namespace detail {

inline auto parse_port(std::string_view s) -> std::optional<std::uint16_t> {
    unsigned value = 0;
    if (s.empty()) return std::nullopt;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || p != s.data() + s.size() || value == 0 || value > 65535)
        return std::nullopt;
    return static_cast<std::uint16_t>(value);
}

inline auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace detail

// =============================================================================
// Endpoint parsing
// =============================================================================

/// "host:port"; exactly one ':' and a port in 1..65535
export inline auto parse_endpoint(std::string_view text)
    -> std::expected<configuration_endpoint, error>
{
    auto s = detail::trim(text);
    auto colon = s.find(':');
    if (colon == std::string_view::npos || s.find(':', colon + 1) != std::string_view::npos)
        return std::unexpected(error{make_error_code(cluster_errc::malformed_endpoint),
            std::format("Server configuration should be in format host:port, got '{}'", s)});

    auto host = s.substr(0, colon);
    auto port = detail::parse_port(s.substr(colon + 1));
    if (host.empty() || !port)
        return std::unexpected(error{make_error_code(cluster_errc::malformed_endpoint),
            std::format("Server configuration should be in format host:port, got '{}'", s)});

    return configuration_endpoint{std::string(host), *port};
}

/// Location list as given to a cache backend: entries separated by ';' or ','
export inline auto split_location(std::string_view location) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= location.size()) {
        auto end = location.find_first_of(";,", start);
        if (end == std::string_view::npos) end = location.size();
        auto part = detail::trim(location.substr(start, end - start));
        if (!part.empty()) out.emplace_back(part);
        start = end + 1;
    }
    return out;
}

/// Exactly one entry, which must parse as an endpoint
export inline auto parse_single_endpoint(std::span<const std::string> locations)
    -> std::expected<configuration_endpoint, error>
{
    if (locations.empty())
        return std::unexpected(error{make_error_code(cluster_errc::no_endpoint),
            "A configuration endpoint is required"});
    if (locations.size() > 1)
        return std::unexpected(error{make_error_code(cluster_errc::multiple_endpoints),
            "ElastiCache should be configured with only one server (Configuration Endpoint)"});
    return parse_endpoint(locations.front());
}

// =============================================================================
// Engine version
// =============================================================================

/// "1.4.14" -> {1, 4, 14}. Trailing non-digits of a component are ignored
/// ("1.6.6-beta"); missing components are 0.
export inline auto parse_engine_version(std::string_view v)
    -> std::optional<std::array<unsigned, 3>>
{
    std::array<unsigned, 3> out{};
    std::size_t idx = 0;
    while (!v.empty() && idx < out.size()) {
        auto dot = v.find('.');
        auto part = v.substr(0, dot);
        auto [p, ec] = std::from_chars(part.data(), part.data() + part.size(), out[idx]);
        if (ec != std::errc{}) return std::nullopt;
        ++idx;
        if (dot == std::string_view::npos) break;
        v.remove_prefix(dot + 1);
    }
    if (idx == 0) return std::nullopt;
    return out;
}

/// `config get cluster` exists from 1.4.14; unknown versions are assumed recent
export inline auto supports_config_command(std::string_view engine_version) -> bool {
    auto v = parse_engine_version(engine_version);
    if (!v) return true;
    return *v >= std::array<unsigned, 3>{1, 4, 14};
}

// =============================================================================
// Configuration payload
// =============================================================================

/// <config_version>\n<host>|<ip>|<port> <host>|<ip>|<port> ...\n
///
/// \r\n or \n line breaks, blank lines and runs of blanks between nodes are
/// accepted. Anything else is cluster_errc::malformed_config.
export inline auto parse_cluster_payload(std::string_view payload)
    -> std::expected<cluster_config, error>
{
    auto malformed = [](std::string reason) {
        return std::unexpected(error{make_error_code(cluster_errc::malformed_config),
                                     std::format("malformed cluster configuration: {}", reason)});
    };

    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < payload.size()) {
        auto nl = payload.find('\n', pos);
        if (nl == std::string_view::npos) nl = payload.size();
        auto line = payload.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        line = detail::trim(line);
        if (!line.empty()) lines.push_back(line);
        pos = nl + 1;
    }

    if (lines.size() != 2)
        return malformed(std::format("expected 2 lines, got {}", lines.size()));

    cluster_config cfg;
    auto [p, ec] = std::from_chars(lines[0].data(), lines[0].data() + lines[0].size(),
                                   cfg.config_version);
    if (ec != std::errc{} || p != lines[0].data() + lines[0].size())
        return malformed(std::format("bad version '{}'", lines[0]));

    auto nodes = lines[1];
    std::size_t i = 0;
    while (i < nodes.size()) {
        while (i < nodes.size() && (nodes[i] == ' ' || nodes[i] == '\t')) ++i;
        auto start = i;
        while (i < nodes.size() && nodes[i] != ' ' && nodes[i] != '\t') ++i;
        if (i == start) break;
        auto entry = nodes.substr(start, i - start);

        auto bar1 = entry.find('|');
        auto bar2 = bar1 == std::string_view::npos ? bar1 : entry.find('|', bar1 + 1);
        if (bar2 == std::string_view::npos || entry.find('|', bar2 + 1) != std::string_view::npos)
            return malformed(std::format("bad node '{}'", entry));

        auto host = entry.substr(0, bar1);
        auto ip   = entry.substr(bar1 + 1, bar2 - bar1 - 1);
        auto port = detail::parse_port(entry.substr(bar2 + 1));
        if (!port)
            return malformed(std::format("bad port in node '{}'", entry));
        if (host.empty() && ip.empty())
            return malformed(std::format("node without address '{}'", entry));

        cfg.nodes.push_back({std::string(ip.empty() ? host : ip), *port});
    }

    if (cfg.nodes.empty())
        return malformed("empty node list");
    return cfg;
}

} // namespace clustermc

template <>
struct std::is_error_code_enum<clustermc::cluster_errc> : std::true_type {};

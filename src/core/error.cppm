module;

#include <clustermc/config.hpp>

#ifdef CLUSTERMC_PLATFORM_WINDOWS
#include <WinSock2.h>
#endif

export module clustermc.core.error;

import std;

namespace clustermc {

// =============================================================================
// Network error codes
// =============================================================================

/// Transport-level error codes shared by every protocol module
export enum class errc {
    success = 0,

    // Connection
    connection_refused,
    connection_reset,
    connection_aborted,
    connection_timed_out,
    not_connected,
    already_connected,

    // Address
    address_in_use,
    address_not_available,
    address_family_not_supported,

    // Operation
    operation_aborted,
    operation_in_progress,
    operation_not_supported,
    operation_would_block,

    // Resources
    too_many_files_open,
    no_buffer_space,
    out_of_memory,

    // Network
    network_down,
    network_unreachable,
    host_unreachable,
    host_not_found,

    // I/O
    broken_pipe,
    end_of_file,
    bad_descriptor,

    // Generic
    permission_denied,
    invalid_argument,
    unknown_error,
};

// =============================================================================
// error_category
// =============================================================================

export class network_error_category : public std::error_category {
public:
    [[nodiscard]] auto name() const noexcept -> const char* override {
        return "clustermc";
    }

    [[nodiscard]] auto message(int ev) const -> std::string override {
        switch (static_cast<errc>(ev)) {
            case errc::success:                     return "success";
            case errc::connection_refused:          return "connection refused";
            case errc::connection_reset:            return "connection reset";
            case errc::connection_aborted:          return "connection aborted";
            case errc::connection_timed_out:        return "connection timed out";
            case errc::not_connected:               return "not connected";
            case errc::already_connected:           return "already connected";
            case errc::address_in_use:              return "address in use";
            case errc::address_not_available:       return "address not available";
            case errc::address_family_not_supported: return "address family not supported";
            case errc::operation_aborted:           return "operation aborted";
            case errc::operation_in_progress:       return "operation in progress";
            case errc::operation_not_supported:     return "operation not supported";
            case errc::operation_would_block:       return "operation would block";
            case errc::too_many_files_open:         return "too many files open";
            case errc::no_buffer_space:             return "no buffer space";
            case errc::out_of_memory:               return "out of memory";
            case errc::network_down:                return "network down";
            case errc::network_unreachable:         return "network unreachable";
            case errc::host_unreachable:            return "host unreachable";
            case errc::host_not_found:              return "host not found";
            case errc::broken_pipe:                 return "broken pipe";
            case errc::end_of_file:                 return "end of file";
            case errc::bad_descriptor:              return "bad descriptor";
            case errc::permission_denied:           return "permission denied";
            case errc::invalid_argument:            return "invalid argument";
            case errc::unknown_error:               return "unknown error";
            default:                                return "unrecognized error";
        }
    }
};

export [[nodiscard]] inline auto network_category() noexcept
    -> const std::error_category&
{
    static const network_error_category instance;
    return instance;
}

export [[nodiscard]] inline auto make_error_code(errc e) noexcept
    -> std::error_code
{
    return {static_cast<int>(e), network_category()};
}

/// Map a native errno / WSA error to clustermc::errc
export [[nodiscard]] auto from_native_error(int native_error) noexcept -> errc;

/// True for failures that mean "the peer could not be reached or went away"
/// (as opposed to a protocol or usage error)
export [[nodiscard]] auto is_connectivity_error(std::error_code ec) noexcept -> bool;

// =============================================================================
// error: error_code plus context
// =============================================================================

/// Value type carried by every std::expected in the public API.
/// code() classifies the failure, message() describes it for humans,
/// cause() keeps the lower-level error that was wrapped (if any).
export class error {
public:
    error() noexcept = default;

    error(std::error_code code) noexcept : code_(code) {}

    error(std::error_code code, std::string message,
          std::error_code cause = {}) noexcept
        : code_(code), message_(std::move(message)), cause_(cause) {}

    [[nodiscard]] auto code() const noexcept -> std::error_code { return code_; }
    [[nodiscard]] auto cause() const noexcept -> std::error_code { return cause_; }

    [[nodiscard]] auto message() const -> std::string {
        return message_.empty() ? code_.message() : message_;
    }

    explicit operator bool() const noexcept { return static_cast<bool>(code_); }

    friend auto operator==(const error& e, std::error_code ec) noexcept -> bool {
        return e.code_ == ec;
    }

private:
    std::error_code code_;
    std::string     message_;
    std::error_code cause_;
};

} // namespace clustermc

template <>
struct std::is_error_code_enum<clustermc::errc> : std::true_type {};

module;

#include <clustermc/config.hpp>

export module clustermc.core.buffer;

import std;

namespace clustermc {

// =============================================================================
// Buffer views
// =============================================================================

/// Read-only view over bytes (non-owning)
export struct const_buffer {
    const void* data = nullptr;
    std::size_t size = 0;

    constexpr const_buffer() noexcept = default;
    constexpr const_buffer(const void* p, std::size_t n) noexcept
        : data(p), size(n) {}

    constexpr const_buffer(std::span<const std::byte> s) noexcept
        : data(s.data()), size(s.size()) {}

    /// Drop the first n bytes
    [[nodiscard]] constexpr auto advanced(std::size_t n) const noexcept -> const_buffer {
        n = n > size ? size : n;
        return {static_cast<const std::byte*>(data) + n, size - n};
    }
};

/// Writable view over bytes (non-owning)
export struct mutable_buffer {
    void* data = nullptr;
    std::size_t size = 0;

    constexpr mutable_buffer() noexcept = default;
    constexpr mutable_buffer(void* p, std::size_t n) noexcept
        : data(p), size(n) {}

    constexpr mutable_buffer(std::span<std::byte> s) noexcept
        : data(s.data()), size(s.size()) {}

    constexpr operator const_buffer() const noexcept {
        return {data, size};
    }
};

// =============================================================================
// Factories
// =============================================================================

export constexpr auto buffer(const void* data, std::size_t size) noexcept
    -> const_buffer
{
    return {data, size};
}

export constexpr auto buffer(void* data, std::size_t size) noexcept
    -> mutable_buffer
{
    return {data, size};
}

export constexpr auto buffer(std::string_view sv) noexcept
    -> const_buffer
{
    return {sv.data(), sv.size()};
}

export template <std::size_t N>
constexpr auto buffer(std::array<std::byte, N>& a) noexcept
    -> mutable_buffer
{
    return {a.data(), N};
}

} // namespace clustermc

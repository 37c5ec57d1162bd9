#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ksuid::crypto {

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Fill a buffer from the operating system's secure random source.
 */
[[nodiscard]] Result<void, Error> fill_random(std::span<std::uint8_t> out);

/**
 * Generate N secure random bytes.
 */
template<std::size_t N>
[[nodiscard]] Result<std::array<std::uint8_t, N>, Error> random_bytes() {
    std::array<std::uint8_t, N> bytes{};
    const auto filled = fill_random(bytes);
    if (filled.is_err()) {
        return Result<std::array<std::uint8_t, N>, Error>::err(filled.unwrap_err());
    }
    return Result<std::array<std::uint8_t, N>, Error>::ok(bytes);
}

} // namespace ksuid::crypto

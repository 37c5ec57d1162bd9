#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace ksuid {

// KSUID timestamps count seconds from this point (2014-05-13T16:53:20Z)
// rather than the Unix epoch, so the 32-bit offset runs out only in 2150.
inline constexpr std::int64_t EPOCH = 1'400'000'000;
inline constexpr std::int64_t MAX_TIME = EPOCH + 0xFFFF'FFFFLL;

inline constexpr std::size_t TIMESTAMP_SIZE = 4;
inline constexpr std::size_t PAYLOAD_SIZE = 16;
inline constexpr std::size_t BYTE_SIZE = TIMESTAMP_SIZE + PAYLOAD_SIZE;

using Bytes = std::array<std::uint8_t, BYTE_SIZE>;
using Payload = std::array<std::uint8_t, PAYLOAD_SIZE>;

/**
 * Pack a timestamp and payload into the 20-byte binary layout.
 *
 * timestamp is absolute Unix seconds and must lie in [EPOCH, MAX_TIME];
 * the system clock is read when it is omitted. payload must be exactly
 * PAYLOAD_SIZE bytes; secure random bytes are drawn when it is omitted.
 * Explicit zero values are used as given.
 */
[[nodiscard]] Result<Bytes> construct(
    std::optional<std::int64_t> timestamp = std::nullopt,
    std::optional<std::span<const std::uint8_t>> payload = std::nullopt);

/**
 * Parse a decimal Unix timestamp. Range is checked by construct().
 */
[[nodiscard]] Result<std::int64_t> parse_timestamp(std::string_view text);

namespace detail {

[[nodiscard]] constexpr Bytes pack(std::uint32_t offset, const Payload& payload) noexcept {
    Bytes out{};
    out[0] = static_cast<std::uint8_t>(offset >> 24);
    out[1] = static_cast<std::uint8_t>(offset >> 16);
    out[2] = static_cast<std::uint8_t>(offset >> 8);
    out[3] = static_cast<std::uint8_t>(offset);
    for (std::size_t i = 0; i < PAYLOAD_SIZE; ++i) {
        out[TIMESTAMP_SIZE + i] = payload[i];
    }
    return out;
}

[[nodiscard]] constexpr std::int64_t timestamp_of(const Bytes& bytes) noexcept {
    const std::uint32_t offset = (static_cast<std::uint32_t>(bytes[0]) << 24) |
                                 (static_cast<std::uint32_t>(bytes[1]) << 16) |
                                 (static_cast<std::uint32_t>(bytes[2]) << 8) |
                                 static_cast<std::uint32_t>(bytes[3]);
    return EPOCH + offset;
}

[[nodiscard]] constexpr Payload payload_of(const Bytes& bytes) noexcept {
    Payload out{};
    for (std::size_t i = 0; i < PAYLOAD_SIZE; ++i) {
        out[i] = bytes[TIMESTAMP_SIZE + i];
    }
    return out;
}

} // namespace detail

} // namespace ksuid

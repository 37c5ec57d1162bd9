#pragma once

#include "core/binary_codec.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <span>

namespace ksuid {

/**
 * The KSUID one above bytes in the 160-bit ordering.
 *
 * An all-0xFF payload wraps to zero and carries into the timestamp. Fails
 * with InvalidKSUID for a malformed buffer and with InvalidTimestamp when
 * the carry would pass MAX_TIME.
 */
[[nodiscard]] Result<Bytes> successor(std::span<const std::uint8_t> bytes);

/**
 * The KSUID one below bytes. A zero payload wraps to all-0xFF and borrows
 * from the timestamp; fails with InvalidTimestamp below EPOCH.
 */
[[nodiscard]] Result<Bytes> predecessor(std::span<const std::uint8_t> bytes);

namespace detail {

// Returns false when the payload wrapped around (carry out).
[[nodiscard]] constexpr bool increment(Payload& payload) noexcept {
    for (std::size_t i = payload.size(); i-- > 0;) {
        if (++payload[i] != 0x00) {
            return true;
        }
    }
    return false;
}

// Returns false when the payload wrapped around (borrow out).
[[nodiscard]] constexpr bool decrement(Payload& payload) noexcept {
    for (std::size_t i = payload.size(); i-- > 0;) {
        if (payload[i]-- != 0x00) {
            return true;
        }
    }
    return false;
}

} // namespace detail

} // namespace ksuid

#pragma once

#include "core/base62.hpp"
#include "core/binary_codec.hpp"
#include "core/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ksuid {

namespace detail {

[[nodiscard]] constexpr Bytes filled(std::uint8_t value) noexcept {
    Bytes out{};
    out.fill(value);
    return out;
}

inline constexpr auto MIN_STRING_DIGITS = base62::detail::encode_digits(filled(0x00));
inline constexpr auto MAX_STRING_DIGITS = base62::detail::encode_digits(filled(0xFF));

} // namespace detail

inline constexpr Bytes MIN = detail::filled(0x00);
inline constexpr Bytes MAX = detail::filled(0xFF);

// "000000000000000000000000000" and "aWgEPTl1tmebfsQzFP4bxwgy80V".
inline constexpr std::string_view MIN_STRING{detail::MIN_STRING_DIGITS.data(),
                                             detail::MIN_STRING_DIGITS.size()};
inline constexpr std::string_view MAX_STRING{detail::MAX_STRING_DIGITS.data(),
                                             detail::MAX_STRING_DIGITS.size()};

/**
 * True iff bytes is a well-formed binary KSUID: BYTE_SIZE bytes within
 * [MIN, MAX].
 */
[[nodiscard]] bool is_valid_binary(std::span<const std::uint8_t> bytes) noexcept;

/**
 * True iff text is a well-formed KSUID string: STRING_SIZE characters,
 * within [MIN_STRING, MAX_STRING], all from the base-62 alphabet.
 *
 * The range check rejects strings that are syntactically base 62 but
 * overflow 160 bits.
 */
[[nodiscard]] bool is_valid_string(std::string_view text) noexcept;

/**
 * Copy bytes into a Bytes value, or fail with InvalidKSUID.
 */
[[nodiscard]] Result<Bytes> require_valid(std::span<const std::uint8_t> bytes);

// Double-quoted rendering with non-printable bytes escaped as \xNN, for
// putting untrusted input into error messages.
[[nodiscard]] std::string safely_printed(std::string_view text);
[[nodiscard]] std::string safely_printed(std::span<const std::uint8_t> bytes);

} // namespace ksuid

#pragma once

#include "core/binary_codec.hpp"
#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ksuid::base62 {

inline constexpr std::uint32_t BASE = 62;
inline constexpr std::size_t STRING_SIZE = 27;

// Digits, then upper case, then lower case: digit value and ASCII order
// agree, so string order equals numeric order.
inline constexpr std::string_view ALPHABET =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

/**
 * Value of a base-62 digit, or -1 if c is not in ALPHABET.
 */
[[nodiscard]] constexpr int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

namespace detail {

/**
 * Fixed-width encoding of the 160-bit big-endian integer in bytes.
 *
 * The value is held as five 32-bit words and divided by BASE in place,
 * one digit per pass, least significant digit first.
 */
[[nodiscard]] constexpr std::array<char, STRING_SIZE> encode_digits(const Bytes& bytes) noexcept {
    std::array<std::uint32_t, BYTE_SIZE / 4> words{};
    for (std::size_t i = 0; i < words.size(); ++i) {
        words[i] = (static_cast<std::uint32_t>(bytes[4 * i]) << 24) |
                   (static_cast<std::uint32_t>(bytes[4 * i + 1]) << 16) |
                   (static_cast<std::uint32_t>(bytes[4 * i + 2]) << 8) |
                   static_cast<std::uint32_t>(bytes[4 * i + 3]);
    }

    std::array<char, STRING_SIZE> out{};
    for (auto& c : out) {
        c = ALPHABET[0];
    }

    std::size_t first = 0;
    while (first < words.size() && words[first] == 0) ++first;

    std::size_t pos = STRING_SIZE;
    while (first < words.size()) {
        std::uint64_t remainder = 0;
        for (std::size_t i = first; i < words.size(); ++i) {
            const std::uint64_t value = (remainder << 32) | words[i];
            words[i] = static_cast<std::uint32_t>(value / BASE);
            remainder = value % BASE;
        }
        out[--pos] = ALPHABET[static_cast<std::size_t>(remainder)];
        while (first < words.size() && words[first] == 0) ++first;
    }
    return out;
}

} // namespace detail

/**
 * Encode 20 bytes as a 27-character, zero-padded base-62 string.
 */
[[nodiscard]] std::string encode(const Bytes& bytes);

/**
 * Decode a 27-character base-62 string into 20 big-endian bytes.
 *
 * Fails with InvalidBase62Digit for a character outside ALPHABET, and with
 * InvalidKSUIDString for a wrong length or a value wider than 160 bits.
 */
[[nodiscard]] Result<Bytes> decode(std::string_view text);

} // namespace ksuid::base62

#pragma once

#include "core/binary_codec.hpp"
#include "core/result.hpp"
#include "core/validator.hpp"

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ksuid {

/**
 * Ksuid - K-Sortable Unique IDentifier.
 *
 * A 20-byte value: a 4-byte big-endian count of seconds since EPOCH
 * followed by a 16-byte payload. Byte order, string order and creation
 * time order agree. Values are immutable; next() and previous() return
 * new values.
 */
class Ksuid {
public:
    static constexpr size_t BYTE_SIZE = ksuid::BYTE_SIZE;
    using Bytes = ksuid::Bytes;

    /**
     * The smallest KSUID (all zero bytes).
     */
    constexpr Ksuid() noexcept : bytes_{} {}

    /**
     * Wrap raw bytes. Every 20-byte value is a valid KSUID.
     */
    explicit constexpr Ksuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Build a KSUID from a timestamp and payload; see construct().
     */
    [[nodiscard]] static Result<Ksuid> create(
        std::optional<std::int64_t> timestamp = std::nullopt,
        std::optional<std::span<const std::uint8_t>> payload = std::nullopt);

    /**
     * A new KSUID for the current second with a random payload.
     * Throws std::runtime_error if the clock or random source is unusable.
     */
    [[nodiscard]] static Ksuid generate();

    /**
     * Parse a 27-character KSUID string.
     */
    [[nodiscard]] static Result<Ksuid> parse(std::string_view text);

    /**
     * Copy a KSUID out of a raw buffer, which must hold exactly BYTE_SIZE bytes.
     */
    [[nodiscard]] static Result<Ksuid> from_bytes(std::span<const std::uint8_t> bytes);

    [[nodiscard]] static constexpr Ksuid min() noexcept { return Ksuid(MIN); }
    [[nodiscard]] static constexpr Ksuid max() noexcept { return Ksuid(MAX); }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] constexpr Payload payload() const noexcept {
        return detail::payload_of(bytes_);
    }

    /**
     * Absolute Unix seconds.
     */
    [[nodiscard]] constexpr std::int64_t timestamp() const noexcept {
        return detail::timestamp_of(bytes_);
    }

    [[nodiscard]] std::chrono::system_clock::time_point time_point() const noexcept {
        return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp()));
    }

    /**
     * The 27-character base-62 form.
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] Result<Ksuid> next() const;
    [[nodiscard]] Result<Ksuid> previous() const;

    auto operator<=>(const Ksuid&) const = default;
    bool operator==(const Ksuid&) const = default;

private:
    Bytes bytes_;
};

} // namespace ksuid

namespace std {
    template<>
    struct hash<ksuid::Ksuid> {
        size_t operator()(const ksuid::Ksuid& id) const noexcept {
            const auto& bytes = id.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}

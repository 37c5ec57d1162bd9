#include "core/binary_codec.hpp"

#include "core/validator.hpp"
#include "crypto/random.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <string>

namespace ksuid {

namespace {

[[nodiscard]] std::int64_t now_seconds() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

[[nodiscard]] Result<Bytes> timestamp_out_of_range(std::int64_t timestamp) {
    return Result<Bytes>::err(Error{
        ErrorCode::InvalidTimestamp,
        "Timestamp must be between " + std::to_string(EPOCH) + " and " +
            std::to_string(MAX_TIME) + ", got " + std::to_string(timestamp) + " instead"});
}

[[nodiscard]] bool in_range(std::int64_t timestamp) noexcept {
    return timestamp >= EPOCH && timestamp <= MAX_TIME;
}

} // namespace

Result<Bytes> construct(std::optional<std::int64_t> timestamp,
                        std::optional<std::span<const std::uint8_t>> payload) {
    if (timestamp && !in_range(*timestamp)) {
        return timestamp_out_of_range(*timestamp);
    }

    if (payload && payload->size() != PAYLOAD_SIZE) {
        return Result<Bytes>::err(Error{
            ErrorCode::InvalidPayloadLength,
            "KSUID payloads must have " + std::to_string(PAYLOAD_SIZE) + " bytes, got " +
                std::to_string(payload->size()) + " instead"});
    }

    const auto seconds = timestamp.value_or(now_seconds());
    if (!in_range(seconds)) {
        return timestamp_out_of_range(seconds);
    }

    Payload data{};
    if (payload) {
        std::copy(payload->begin(), payload->end(), data.begin());
    } else {
        auto random = crypto::random_bytes<PAYLOAD_SIZE>();
        if (random.is_err()) {
            return Result<Bytes>::err(random.unwrap_err());
        }
        data = random.unwrap();
    }

    return Result<Bytes>::ok(detail::pack(static_cast<std::uint32_t>(seconds - EPOCH), data));
}

Result<std::int64_t> parse_timestamp(std::string_view text) {
    std::int64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return Result<std::int64_t>::err(Error{
            ErrorCode::InvalidTimestamp,
            "Timestamp must be numeric, got " + safely_printed(text) + " instead"});
    }
    return Result<std::int64_t>::ok(value);
}

} // namespace ksuid

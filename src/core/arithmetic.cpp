#include "core/arithmetic.hpp"

#include "core/validator.hpp"

namespace ksuid {

Result<Bytes> successor(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).and_then([](const Bytes& current) {
        const auto timestamp = detail::timestamp_of(current);
        auto payload = detail::payload_of(current);
        if (!detail::increment(payload)) {
            return construct(timestamp + 1, std::span<const std::uint8_t>(payload));
        }
        return construct(timestamp, std::span<const std::uint8_t>(payload));
    });
}

Result<Bytes> predecessor(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).and_then([](const Bytes& current) {
        const auto timestamp = detail::timestamp_of(current);
        auto payload = detail::payload_of(current);
        if (!detail::decrement(payload)) {
            return construct(timestamp - 1, std::span<const std::uint8_t>(payload));
        }
        return construct(timestamp, std::span<const std::uint8_t>(payload));
    });
}

} // namespace ksuid

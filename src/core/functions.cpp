#include "core/functions.hpp"

#include "core/base62.hpp"
#include "core/validator.hpp"

namespace ksuid {

Result<std::string> to_string(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).map([](const Bytes& valid) { return base62::encode(valid); });
}

Result<Bytes> from_string(std::string_view text) {
    if (!is_valid_string(text)) {
        return Result<Bytes>::err(Error{
            ErrorCode::InvalidKSUIDString,
            "Expected a string KSUID, got instead " + safely_printed(text)});
    }
    return base62::decode(text);
}

Result<std::int64_t> timestamp_of(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).map([](const Bytes& valid) { return detail::timestamp_of(valid); });
}

Result<Payload> payload_of(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).map([](const Bytes& valid) { return detail::payload_of(valid); });
}

} // namespace ksuid

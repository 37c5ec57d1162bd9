#include "core/base62.hpp"

#include "core/validator.hpp"

namespace ksuid::base62 {

std::string encode(const Bytes& bytes) {
    const auto digits = detail::encode_digits(bytes);
    return std::string(digits.begin(), digits.end());
}

Result<Bytes> decode(std::string_view text) {
    if (text.size() != STRING_SIZE) {
        return Result<Bytes>::err(Error{
            ErrorCode::InvalidKSUIDString,
            "Expected a " + std::to_string(STRING_SIZE) + "-character KSUID string, got " +
                safely_printed(text) + " instead"});
    }

    Bytes out{};
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const int digit = digit_value(text[pos]);
        if (digit < 0) {
            return Result<Bytes>::err(Error{
                ErrorCode::InvalidBase62Digit,
                "Invalid base-62 digit " + safely_printed(text.substr(pos, 1)) +
                    " at position " + std::to_string(pos) + " in " + safely_printed(text)});
        }

        // out = out * BASE + digit, least significant byte first.
        std::uint32_t carry = static_cast<std::uint32_t>(digit);
        for (std::size_t i = out.size(); i-- > 0;) {
            const std::uint32_t value = out[i] * BASE + carry;
            out[i] = static_cast<std::uint8_t>(value & 0xFF);
            carry = value >> 8;
        }
        if (carry != 0) {
            return Result<Bytes>::err(Error{
                ErrorCode::InvalidKSUIDString,
                "KSUID string " + safely_printed(text) + " exceeds 160 bits"});
        }
    }
    return Result<Bytes>::ok(out);
}

} // namespace ksuid::base62

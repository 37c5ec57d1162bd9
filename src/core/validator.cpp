#include "core/validator.hpp"

#include <algorithm>

namespace ksuid {

static_assert(MIN_STRING == "000000000000000000000000000");
static_assert(MAX_STRING.size() == base62::STRING_SIZE);

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

void append_escaped(std::string& out, std::uint8_t byte) {
    if (byte == '"' || byte == '\\') {
        out += '\\';
        out += static_cast<char>(byte);
    } else if (byte >= 0x20 && byte < 0x7F) {
        out += static_cast<char>(byte);
    } else {
        out += "\\x";
        out += kHexDigits[byte >> 4];
        out += kHexDigits[byte & 0x0F];
    }
}

} // namespace

bool is_valid_binary(std::span<const std::uint8_t> bytes) noexcept {
    if (bytes.size() != BYTE_SIZE) {
        return false;
    }
    const bool below_min = std::lexicographical_compare(
        bytes.begin(), bytes.end(), MIN.begin(), MIN.end());
    const bool above_max = std::lexicographical_compare(
        MAX.begin(), MAX.end(), bytes.begin(), bytes.end());
    return !below_min && !above_max;
}

bool is_valid_string(std::string_view text) noexcept {
    return text.size() == base62::STRING_SIZE
        && text >= MIN_STRING
        && text <= MAX_STRING
        && std::all_of(text.begin(), text.end(),
                       [](char c) { return base62::digit_value(c) >= 0; });
}

Result<Bytes> require_valid(std::span<const std::uint8_t> bytes) {
    if (!is_valid_binary(bytes)) {
        return Result<Bytes>::err(Error{
            ErrorCode::InvalidKSUID,
            "Expected a valid KSUID, got instead " + safely_printed(bytes)});
    }
    Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<Bytes>::ok(out);
}

std::string safely_printed(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        append_escaped(out, static_cast<std::uint8_t>(c));
    }
    out += '"';
    return out;
}

std::string safely_printed(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 4 + 2);
    out += '"';
    for (auto byte : bytes) {
        append_escaped(out, byte);
    }
    out += '"';
    return out;
}

} // namespace ksuid

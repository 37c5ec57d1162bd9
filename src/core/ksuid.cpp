#include "core/ksuid.hpp"

#include "core/arithmetic.hpp"
#include "core/base62.hpp"
#include "core/functions.hpp"

#include <type_traits>

namespace ksuid {

static_assert(sizeof(Ksuid) == BYTE_SIZE, "Ksuid should be 20 bytes");
static_assert(std::is_trivially_copyable_v<Ksuid>, "Ksuid should be trivially copyable");
static_assert(Ksuid::min() < Ksuid::max());

namespace {

[[nodiscard]] Ksuid wrap(const Bytes& bytes) {
    return Ksuid(bytes);
}

} // namespace

Result<Ksuid> Ksuid::create(std::optional<std::int64_t> timestamp,
                            std::optional<std::span<const std::uint8_t>> payload) {
    return construct(timestamp, payload).map(wrap);
}

Ksuid Ksuid::generate() {
    return create().unwrap();
}

Result<Ksuid> Ksuid::parse(std::string_view text) {
    return from_string(text).map(wrap);
}

Result<Ksuid> Ksuid::from_bytes(std::span<const std::uint8_t> bytes) {
    return require_valid(bytes).map(wrap);
}

std::string Ksuid::to_string() const {
    return base62::encode(bytes_);
}

Result<Ksuid> Ksuid::next() const {
    return successor(bytes_).map(wrap);
}

Result<Ksuid> Ksuid::previous() const {
    return predecessor(bytes_).map(wrap);
}

} // namespace ksuid

#include "crypto/random.hpp"

#include <sodium.h>

namespace ksuid::crypto {

Result<void, Error> init() {
    // 0 on first initialization, 1 if already initialized.
    if (sodium_init() < 0) {
        return Result<void, Error>::err(
            Error{ErrorCode::RandomSourceUnavailable, "Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> fill_random(std::span<std::uint8_t> out) {
    return init().and_then([out]() {
        randombytes_buf(out.data(), out.size());
        return Result<void, Error>::ok();
    });
}

} // namespace ksuid::crypto

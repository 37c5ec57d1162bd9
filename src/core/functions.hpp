#pragma once

#include "core/binary_codec.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ksuid {

// Checked operations over raw byte buffers. Each validates its input
// before doing any work and fails with InvalidKSUID (or InvalidKSUIDString)
// naming the offending value.

[[nodiscard]] Result<std::string> to_string(std::span<const std::uint8_t> bytes);

[[nodiscard]] Result<Bytes> from_string(std::string_view text);

[[nodiscard]] Result<std::int64_t> timestamp_of(std::span<const std::uint8_t> bytes);

[[nodiscard]] Result<Payload> payload_of(std::span<const std::uint8_t> bytes);

} // namespace ksuid

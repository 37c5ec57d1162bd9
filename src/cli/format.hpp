#pragma once

#include <QString>
#include <QStringList>

#include "core/ksuid.hpp"
#include "core/result.hpp"

namespace ksuid::cli {

enum class OutputFormat {
    String,
    Inspect,
    Time,
    Timestamp,
    Payload,
    Raw,
};

[[nodiscard]] QStringList format_names();

[[nodiscard]] Result<OutputFormat> parse_format(const QString& name);

// One KSUID rendered in the given format, newline-terminated.
[[nodiscard]] QString format_ksuid(const Ksuid& id, OutputFormat format);

[[nodiscard]] QString to_hex(std::span<const std::uint8_t> bytes);

} // namespace ksuid::cli

#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

#include "cli/format.hpp"
#include "core/result.hpp"

namespace ksuid::cli {

struct NewOptions {
    int count = 1;
    QString time;      // decimal Unix seconds; empty means now
    QString payload;   // 32 hex digits; empty means random
    OutputFormat format = OutputFormat::String;
};

enum class StepDirection {
    Next,
    Previous,
};

struct CheckReport {
    QString output;
    bool allValid = true;
};

[[nodiscard]] Result<int> parse_count(const QString& text);

[[nodiscard]] Result<std::vector<std::uint8_t>> parse_payload_hex(const QString& text);

// Generates options.count KSUIDs, one formatted entry each.
[[nodiscard]] Result<QString> run_new(const NewOptions& options);

// Parses and re-renders each id. Stops at the first invalid one.
[[nodiscard]] Result<QString> run_inspect(const QStringList& ids, OutputFormat format);

[[nodiscard]] Result<QString> run_step(const QStringList& ids,
                                       StepDirection direction,
                                       OutputFormat format);

// "<id> valid" or "<id> invalid" per line.
[[nodiscard]] CheckReport run_check(const QStringList& ids);

} // namespace ksuid::cli

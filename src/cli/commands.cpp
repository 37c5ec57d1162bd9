#include "cli/commands.hpp"

#include <QRegularExpression>

#include "cli/logging.hpp"
#include "core/binary_codec.hpp"
#include "core/ksuid.hpp"
#include "core/validator.hpp"

namespace ksuid::cli {

namespace {

[[nodiscard]] Result<QString> no_ids_given() {
    return Result<QString>::err(Error{ErrorCode::InvalidArgument, "No KSUIDs given"});
}

[[nodiscard]] Result<Ksuid> parse_id(const QString& text) {
    return Ksuid::parse(text.trimmed().toStdString());
}

[[nodiscard]] Result<Ksuid> create_from(const NewOptions& options) {
    std::optional<std::int64_t> timestamp;
    if (!options.time.isEmpty()) {
        auto parsed = parse_timestamp(options.time.trimmed().toStdString());
        if (parsed.is_err()) {
            return Result<Ksuid>::err(parsed.unwrap_err());
        }
        timestamp = parsed.unwrap();
    }

    if (options.payload.isEmpty()) {
        return Ksuid::create(timestamp);
    }

    return parse_payload_hex(options.payload).and_then(
        [timestamp](const std::vector<std::uint8_t>& payload) {
            return Ksuid::create(timestamp, std::span<const std::uint8_t>(payload));
        });
}

} // namespace

Result<int> parse_count(const QString& text) {
    bool ok = false;
    const int count = text.trimmed().toInt(&ok);
    if (!ok || count < 1) {
        return Result<int>::err(Error{
            ErrorCode::InvalidArgument,
            "Count must be a positive integer, got " + safely_printed(text.toStdString()) +
                " instead"});
    }
    return Result<int>::ok(count);
}

Result<std::vector<std::uint8_t>> parse_payload_hex(const QString& text) {
    static const QRegularExpression hexPattern(QStringLiteral("^(?:[0-9A-Fa-f]{2})*$"));
    const auto trimmed = text.trimmed();
    if (!hexPattern.match(trimmed).hasMatch()) {
        return Result<std::vector<std::uint8_t>>::err(Error{
            ErrorCode::InvalidPayloadLength,
            "Payload must be an even number of hex digits, got " +
                safely_printed(text.toStdString()) + " instead"});
    }
    const auto raw = QByteArray::fromHex(trimmed.toLatin1());
    return Result<std::vector<std::uint8_t>>::ok(
        std::vector<std::uint8_t>(raw.begin(), raw.end()));
}

Result<QString> run_new(const NewOptions& options) {
    if (options.count < 1) {
        return Result<QString>::err(Error{ErrorCode::InvalidArgument, "Count must be positive"});
    }

    QString output;
    for (int i = 0; i < options.count; ++i) {
        const auto id = create_from(options);
        if (id.is_err()) {
            qCWarning(ksuidCliLog) << "new:" << id.unwrap_err().message.c_str();
            return Result<QString>::err(id.unwrap_err());
        }
        qCDebug(ksuidCliLog) << "new:" << id.unwrap().to_string().c_str();
        output += format_ksuid(id.unwrap(), options.format);
    }
    return Result<QString>::ok(output);
}

Result<QString> run_inspect(const QStringList& ids, OutputFormat format) {
    if (ids.isEmpty()) {
        return no_ids_given();
    }

    QString output;
    for (const auto& text : ids) {
        const auto id = parse_id(text);
        if (id.is_err()) {
            qCWarning(ksuidCliLog) << "inspect:" << id.unwrap_err().message.c_str();
            return Result<QString>::err(id.unwrap_err());
        }
        output += format_ksuid(id.unwrap(), format);
    }
    return Result<QString>::ok(output);
}

Result<QString> run_step(const QStringList& ids, StepDirection direction, OutputFormat format) {
    if (ids.isEmpty()) {
        return no_ids_given();
    }

    QString output;
    for (const auto& text : ids) {
        const auto stepped = parse_id(text).and_then([direction](const Ksuid& id) {
            return direction == StepDirection::Next ? id.next() : id.previous();
        });
        if (stepped.is_err()) {
            qCWarning(ksuidCliLog) << "step:" << stepped.unwrap_err().message.c_str();
            return Result<QString>::err(stepped.unwrap_err());
        }
        qCDebug(ksuidCliLog) << "step:" << text << "->" << stepped.unwrap().to_string().c_str();
        output += format_ksuid(stepped.unwrap(), format);
    }
    return Result<QString>::ok(output);
}

CheckReport run_check(const QStringList& ids) {
    CheckReport report;
    for (const auto& text : ids) {
        const bool valid = is_valid_string(text.toStdString());
        report.allValid = report.allValid && valid;
        report.output += text + (valid ? QStringLiteral(" valid\n") : QStringLiteral(" invalid\n"));
    }
    return report;
}

} // namespace ksuid::cli

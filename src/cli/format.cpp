#include "cli/format.hpp"

#include <QByteArray>
#include <QDateTime>

namespace ksuid::cli {

namespace {

struct FormatName {
    const char* name;
    OutputFormat format;
};

constexpr FormatName kFormats[] = {
    {"string", OutputFormat::String},
    {"inspect", OutputFormat::Inspect},
    {"time", OutputFormat::Time},
    {"timestamp", OutputFormat::Timestamp},
    {"payload", OutputFormat::Payload},
    {"raw", OutputFormat::Raw},
};

[[nodiscard]] QString utc_time(const Ksuid& id) {
    return QDateTime::fromSecsSinceEpoch(id.timestamp()).toUTC().toString(Qt::ISODate);
}

[[nodiscard]] QString inspect_report(const Ksuid& id) {
    const auto payload = id.payload();
    return QStringLiteral(
               "REPRESENTATION:\n"
               "\n"
               "  String: %1\n"
               "     Raw: %2\n"
               "\n"
               "COMPONENTS:\n"
               "\n"
               "       Time: %3\n"
               "  Timestamp: %4\n"
               "    Payload: %5\n")
        .arg(QString::fromStdString(id.to_string()),
             to_hex(id.bytes()),
             utc_time(id),
             QString::number(id.timestamp()),
             to_hex(payload));
}

} // namespace

QStringList format_names() {
    QStringList names;
    for (const auto& entry : kFormats) {
        names.append(QString::fromLatin1(entry.name));
    }
    return names;
}

Result<OutputFormat> parse_format(const QString& name) {
    const auto wanted = name.trimmed().toLower();
    for (const auto& entry : kFormats) {
        if (wanted == QLatin1String(entry.name)) {
            return Result<OutputFormat>::ok(entry.format);
        }
    }
    return Result<OutputFormat>::err(Error{
        ErrorCode::InvalidArgument,
        ("Unknown format '" + name + "', expected one of: " +
         format_names().join(QStringLiteral(", "))).toStdString()});
}

QString format_ksuid(const Ksuid& id, OutputFormat format) {
    switch (format) {
        case OutputFormat::String:
            return QString::fromStdString(id.to_string()) + QLatin1Char('\n');
        case OutputFormat::Inspect:
            return inspect_report(id);
        case OutputFormat::Time:
            return utc_time(id) + QLatin1Char('\n');
        case OutputFormat::Timestamp:
            return QString::number(id.timestamp()) + QLatin1Char('\n');
        case OutputFormat::Payload:
            return to_hex(id.payload()) + QLatin1Char('\n');
        case OutputFormat::Raw:
            return to_hex(id.bytes()) + QLatin1Char('\n');
    }
    return QString{};
}

QString to_hex(std::span<const std::uint8_t> bytes) {
    const QByteArray raw(reinterpret_cast<const char*>(bytes.data()),
                         static_cast<qsizetype>(bytes.size()));
    return QString::fromLatin1(raw.toHex().toUpper());
}

} // namespace ksuid::cli

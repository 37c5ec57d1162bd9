#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/config.hpp"
#include "cli/format.hpp"
#include "cli/logging.hpp"
#include "crypto/random.hpp"

namespace {

constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

int fail(const ksuid::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return kExitError;
}

int usage(const QCommandLineParser& parser, const QString& message) {
    QTextStream err(stderr);
    err << message << QLatin1Char('\n') << parser.helpText();
    return kExitUsage;
}

int print(const ksuid::Result<QString>& result) {
    if (result.is_err()) {
        return fail(result.unwrap_err());
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ksuid");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Generate and inspect K-Sortable Unique IDentifiers.\n\n"
        "Commands:\n"
        "  new            generate KSUIDs (default)\n"
        "  inspect ID...  print each KSUID in the chosen format\n"
        "  next ID...     print the successor of each KSUID\n"
        "  prev ID...     print the predecessor of each KSUID\n"
        "  check ID...    report whether each argument is a valid KSUID string"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption countOption(
        QStringList{QStringLiteral("n"), QStringLiteral("count")},
        QStringLiteral("Number of KSUIDs to generate for 'new'."),
        QStringLiteral("count"),
        QStringLiteral("1"));
    parser.addOption(countOption);

    const QCommandLineOption formatOption(
        QStringList{QStringLiteral("f"), QStringLiteral("format")},
        QStringLiteral("Output format: %1 (default from KSUID_FORMAT, else string).")
            .arg(ksuid::cli::format_names().join(QStringLiteral(", "))),
        QStringLiteral("format"));
    parser.addOption(formatOption);

    const QCommandLineOption timeOption(
        QStringList{QStringLiteral("t"), QStringLiteral("time")},
        QStringLiteral("Unix timestamp for 'new' (default: now)."),
        QStringLiteral("seconds"));
    parser.addOption(timeOption);

    const QCommandLineOption payloadOption(
        QStringList{QStringLiteral("p"), QStringLiteral("payload")},
        QStringLiteral("Payload for 'new' as 32 hex digits (default: random)."),
        QStringLiteral("hex"));
    parser.addOption(payloadOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file (also KSUID_LOG_FILE)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging (also KSUID_DEBUG=1)."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of new, inspect, next, prev, check."),
                                 QStringLiteral("[command]"));
    parser.addPositionalArgument(QStringLiteral("ids"),
                                 QStringLiteral("KSUID strings for inspect/next/prev/check."),
                                 QStringLiteral("[ids...]"));
    parser.process(app);

    auto config = ksuid::cli::config_from_environment();
    if (parser.isSet(formatOption)) {
        config.format = parser.value(formatOption);
    }
    if (parser.isSet(logFileOption)) {
        config.logFile = parser.value(logFileOption);
    }
    config.debug = config.debug || parser.isSet(verboseOption);

    ksuid::cli::install_logging(config.logFile, config.debug);
    qCDebug(ksuidCliLog) << "ksuid: logging to" << ksuid::cli::current_log_file_path();

    auto crypto_result = ksuid::crypto::init();
    if (crypto_result.is_err()) {
        qCCritical(ksuidCliLog) << "Failed to initialize crypto:"
                                << crypto_result.unwrap_err().message.c_str();
        return kExitError;
    }

    auto format = ksuid::cli::OutputFormat::String;
    if (!config.format.isEmpty()) {
        const auto parsed = ksuid::cli::parse_format(config.format);
        if (parsed.is_err()) {
            return usage(parser, QString::fromStdString(parsed.unwrap_err().message));
        }
        format = parsed.unwrap();
    }

    auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("new") : positional.takeFirst();
    qCDebug(ksuidCliLog) << "ksuid: command" << command << "args" << positional;

    if (command == QStringLiteral("new")) {
        if (!positional.isEmpty()) {
            return usage(parser, QStringLiteral("'new' takes no arguments"));
        }
        const auto count = ksuid::cli::parse_count(parser.value(countOption));
        if (count.is_err()) {
            return usage(parser, QString::fromStdString(count.unwrap_err().message));
        }

        ksuid::cli::NewOptions options;
        options.count = count.unwrap();
        options.time = parser.value(timeOption);
        options.payload = parser.value(payloadOption);
        options.format = format;
        return print(ksuid::cli::run_new(options));
    }

    if (positional.isEmpty()) {
        return usage(parser, QStringLiteral("'%1' needs at least one KSUID").arg(command));
    }

    if (command == QStringLiteral("inspect")) {
        return print(ksuid::cli::run_inspect(positional, format));
    }
    if (command == QStringLiteral("next")) {
        return print(ksuid::cli::run_step(positional, ksuid::cli::StepDirection::Next, format));
    }
    if (command == QStringLiteral("prev")) {
        return print(ksuid::cli::run_step(positional, ksuid::cli::StepDirection::Previous, format));
    }
    if (command == QStringLiteral("check")) {
        const auto report = ksuid::cli::run_check(positional);
        QTextStream(stdout) << report.output;
        return report.allValid ? 0 : kExitError;
    }

    return usage(parser, QStringLiteral("Unknown command '%1'").arg(command));
}

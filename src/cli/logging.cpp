#include "cli/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(ksuidCliLog, "ksuid.cli", QtInfoMsg)

namespace ksuid::cli {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.close();
    }
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "ksuid: cannot open log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto utf8 = line.toUtf8();

    std::fputs(utf8.constData(), stderr);
    if (s.file.isOpen()) {
        s.file.write(utf8);
        s.file.flush();
    }
}

} // namespace

void install_logging(const QString& logFile, bool debug) {
    open_log_file(state(), logFile);
    if (debug) {
        QLoggingCategory::setFilterRules(QStringLiteral("ksuid.*.debug=true\n"));
    }
    qInstallMessageHandler(message_handler);
}

QString current_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

} // namespace ksuid::cli

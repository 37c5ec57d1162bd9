#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(ksuidCliLog)

namespace ksuid::cli {

// Installs a Qt message handler that writes "<time> <level> <category> <msg>"
// lines to stderr and, if logFile is non-empty, appends them to that file.
void install_logging(const QString& logFile, bool debug);

// Path of the log file in use (empty when logging to stderr only).
QString current_log_file_path();

} // namespace ksuid::cli

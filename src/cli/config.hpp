#pragma once

#include <QString>

namespace ksuid::cli {

// Environment defaults for the ksuid tool. Command line options override them.
//   KSUID_FORMAT    default output format
//   KSUID_LOG_FILE  append log lines to this file as well as stderr
//   KSUID_DEBUG     "1" enables ksuid.* debug logging
struct CliConfig {
    QString format;
    QString logFile;
    bool debug = false;
};

[[nodiscard]] CliConfig config_from_environment();

} // namespace ksuid::cli

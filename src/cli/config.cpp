#include "cli/config.hpp"

#include <QtGlobal>

namespace ksuid::cli {

CliConfig config_from_environment() {
    CliConfig config;
    config.format = qEnvironmentVariable("KSUID_FORMAT").trimmed();
    config.logFile = qEnvironmentVariable("KSUID_LOG_FILE").trimmed();
    config.debug = qEnvironmentVariable("KSUID_DEBUG").trimmed() == QStringLiteral("1");
    return config;
}

} // namespace ksuid::cli

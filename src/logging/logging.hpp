#pragma once

#include <QLoggingCategory>
#include <QString>

#include "core/config.hpp"

Q_DECLARE_LOGGING_CATEGORY(cobaltFfiLog)
Q_DECLARE_LOGGING_CATEGORY(cobaltClockLog)
Q_DECLARE_LOGGING_CATEGORY(cobaltCryptoLog)

namespace cobalt::logging {

// Enables debug output per category according to the config flags.
void apply_filter_rules(const CoreConfig& config);

// Installs a Qt message handler that appends to `path` and chains to the
// handler it replaces. Returns false if the file could not be opened.
bool install_file_logging(const QString& path);

// Applies filter rules and, when a log path is configured, the file sink.
bool install(const CoreConfig& config);

} // namespace cobalt::logging

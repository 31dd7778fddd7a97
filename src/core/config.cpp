#include "core/config.hpp"

#include <QString>
#include <QtGlobal>

namespace cobalt {
namespace {

bool env_flag(const char* name) {
    if (!qEnvironmentVariableIsSet(name)) {
        return false;
    }
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value != QStringLiteral("0") && value != QStringLiteral("false");
}

} // namespace

CoreConfig CoreConfig::from_environment() {
    CoreConfig config;
    config.log_file_path = qEnvironmentVariable("COBALT_LOG_FILE").trimmed().toStdString();
    config.debug_ffi = env_flag("COBALT_DEBUG_FFI");
    config.debug_clock = env_flag("COBALT_DEBUG_CLOCK");
    return config;
}

} // namespace cobalt

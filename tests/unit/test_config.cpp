#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include "logging/logging.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <QtGlobal>

using namespace cobalt;

namespace {

void clear_env() {
    qunsetenv("COBALT_LOG_FILE");
    qunsetenv("COBALT_DEBUG_FFI");
    qunsetenv("COBALT_DEBUG_CLOCK");
}

} // namespace

TEST_CASE("CoreConfig: defaults with an empty environment", "[config]") {
    clear_env();
    const auto config = CoreConfig::from_environment();
    REQUIRE(config.log_file_path.empty());
    REQUIRE_FALSE(config.debug_ffi);
    REQUIRE_FALSE(config.debug_clock);
}

TEST_CASE("CoreConfig: reads COBALT_* variables", "[config]") {
    clear_env();
    qputenv("COBALT_LOG_FILE", " /tmp/cobalt.log ");
    qputenv("COBALT_DEBUG_FFI", "1");
    qputenv("COBALT_DEBUG_CLOCK", "false");

    const auto config = CoreConfig::from_environment();
    REQUIRE(config.log_file_path == "/tmp/cobalt.log");
    REQUIRE(config.debug_ffi);
    REQUIRE_FALSE(config.debug_clock);
    clear_env();
}

TEST_CASE("Logging: debug flags enable category output", "[config][logging]") {
    CoreConfig config;
    config.debug_clock = true;
    logging::apply_filter_rules(config);

    REQUIRE(cobaltClockLog().isDebugEnabled());
    REQUIRE(cobaltFfiLog().isInfoEnabled());
}

TEST_CASE("Logging: file sink records category and message", "[config][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/cobalt.log"));

    CoreConfig config;
    config.log_file_path = path.toStdString();
    REQUIRE(logging::install(config));

    qCWarning(cobaltFfiLog) << "file sink marker";

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());
    REQUIRE(contents.contains(QStringLiteral("cobalt.ffi")));
    REQUIRE(contents.contains(QStringLiteral("file sink marker")));
    REQUIRE(contents.contains(QStringLiteral(" W ")));
}

TEST_CASE("Logging: unwritable path is reported", "[config][logging]") {
    REQUIRE_FALSE(logging::install_file_logging(QStringLiteral("/proc/cobalt/none.log")));
}

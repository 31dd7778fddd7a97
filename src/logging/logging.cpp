#include "logging/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStringList>
#include <QtGlobal>

Q_LOGGING_CATEGORY(cobaltFfiLog, "cobalt.ffi", QtInfoMsg)
Q_LOGGING_CATEGORY(cobaltClockLog, "cobalt.clock", QtInfoMsg)
Q_LOGGING_CATEGORY(cobaltCryptoLog, "cobalt.crypto", QtInfoMsg)

namespace cobalt::logging {
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

struct SinkState {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
};

SinkState& state() {
    static SinkState s;
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        previous = s.previous;

        if (s.file.isOpen()) {
            const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
            const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString();
            const auto line = QStringLiteral("%1 %2 %3 %4\n")
                                  .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
            s.file.write(line.toUtf8());
            s.file.flush();
        }
    }

    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

void apply_filter_rules(const CoreConfig& config) {
    QStringList rules;
    if (config.debug_ffi) {
        rules << QStringLiteral("cobalt.ffi.debug=true");
    }
    if (config.debug_clock) {
        rules << QStringLiteral("cobalt.clock.debug=true");
    }
    if (!rules.isEmpty()) {
        QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
    }
}

bool install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            if (s.file.fileName() == path) {
                return true;
            }
            s.file.close();
        }

        QDir dir(QFileInfo(path).absolutePath());
        dir.mkpath(QStringLiteral("."));

        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
    }

    // Installed outside the lock: the previous handler may log.
    QtMessageHandler previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        QMutexLocker lock(&s.mu);
        s.previous = previous;
    }
    return true;
}

bool install(const CoreConfig& config) {
    apply_filter_rules(config);
    if (config.log_file_path.empty()) {
        return true;
    }
    const auto path = QString::fromStdString(config.log_file_path);
    if (!install_file_logging(path)) {
        qCWarning(cobaltFfiLog) << "cannot open log file" << path;
        return false;
    }
    qCInfo(cobaltFfiLog) << "logging to" << path;
    return true;
}

} // namespace cobalt::logging

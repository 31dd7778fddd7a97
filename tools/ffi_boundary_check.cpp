#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

#include <cstring>

#include "ffi/cobalt_core.h"

namespace {

bool check_uuid_round_trip(int iterations) {
    for (int i = 0; i < iterations; ++i) {
        UUID4_t fresh = cobalt_uuid4_new();
        UUID4_t parsed = cobalt_uuid4_from_cstr(fresh.value);
        char* text = cobalt_uuid4_to_cstr(&parsed);

        const bool ok = parsed.value != nullptr && text != nullptr &&
                        std::strcmp(text, fresh.value) == 0 &&
                        cobalt_uuid4_eq(&fresh, &parsed) == 1 &&
                        cobalt_uuid4_hash(&fresh) == cobalt_uuid4_hash(&parsed);

        cobalt_cstr_drop(text);
        cobalt_uuid4_free(parsed);
        cobalt_uuid4_free(fresh);
        if (!ok) {
            qCritical() << "UUID4 round trip failed at iteration" << i;
            return false;
        }
    }
    return true;
}

bool check_clock_monotonic(int iterations) {
    uint64_t last = 0;
    for (int i = 0; i < iterations; ++i) {
        const uint64_t now = cobalt_unix_timestamp_ns();
        if (now < last) {
            qCritical() << "unix_timestamp_ns went backwards:" << last << "->" << now;
            return false;
        }
        last = now;
    }
    return true;
}

bool check_time_events() {
    TestClock_API* clock = cobalt_test_clock_new();
    bool ok = cobalt_test_clock_set_timer_ns(clock, "heartbeat", 1'000, 0, 10'000) == 1;

    CVec events = cobalt_test_clock_advance_time(clock, 10'000, 1);
    ok = ok && events.len == 10 && events.len <= events.cap;
    cobalt_vec_time_events_drop(events);

    ok = ok && cobalt_test_clock_timer_count(clock) == 0;
    cobalt_test_clock_drop(clock);
    if (!ok) {
        qCritical() << "test clock timer did not fire 10 events";
    }
    return ok;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ffi_boundary_check"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Exercise the cobalt C ABI"));
    parser.addHelpOption();

    const QCommandLineOption iterationsOption(
        QStringList{QStringLiteral("n"), QStringLiteral("iterations")},
        QStringLiteral("Iterations per check (default 1000)."),
        QStringLiteral("count"),
        QStringLiteral("1000"));
    parser.addOption(iterationsOption);
    parser.process(app);

    bool parsed = false;
    const int iterations = parser.value(iterationsOption).toInt(&parsed);
    if (!parsed || iterations <= 0) {
        qCritical() << "invalid --iterations:" << parser.value(iterationsOption);
        return 2;
    }

    if (cobalt_logging_init() == 0) {
        qWarning() << "file logging unavailable, continuing";
    }

    CVec empty = cobalt_cvec_new();
    cobalt_cvec_drop(empty);

    UUID4_t bad = cobalt_uuid4_from_cstr("not-a-uuid");
    if (bad.value != nullptr) {
        qCritical() << "invalid UUID string was accepted";
        cobalt_uuid4_free(bad);
        return 1;
    }

    if (!check_uuid_round_trip(iterations)) return 1;
    if (!check_clock_monotonic(iterations)) return 1;
    if (!check_time_events()) return 1;

    qInfo().noquote() << "ffi boundary OK," << iterations << "iterations";
    return 0;
}

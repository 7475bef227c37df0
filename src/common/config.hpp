#pragma once

#include <QString>

namespace buildprof {

// Settings shared by the CLI entry point and the profiler. Environment
// variables provide the defaults; command-line flags override them.
struct ProfilerConfig {
    bool traceEnabled = false;
    int scanThreads = 1;
    bool recordHistory = true;
    QString outPath = QStringLiteral("build_profile.csv");
    QString format = QStringLiteral("table");
};

// Reads BUILDPROF_TRACE, BUILDPROF_SCAN_THREADS and BUILDPROF_NO_HISTORY.
ProfilerConfig loadConfigFromEnvironment();

int defaultScanThreads();

bool isValidConsoleFormat(const QString &format);

} // namespace buildprof

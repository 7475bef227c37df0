#include "common/config.hpp"

#include <algorithm>
#include <thread>

namespace buildprof {

namespace {

constexpr int kMaxScanThreads = 64;

} // namespace

int defaultScanThreads()
{
    const unsigned int hw = std::thread::hardware_concurrency();
    if (hw == 0) {
        return 1;
    }
    return std::min(static_cast<int>(hw), kMaxScanThreads);
}

ProfilerConfig loadConfigFromEnvironment()
{
    ProfilerConfig config;
    config.traceEnabled = qEnvironmentVariableIntValue("BUILDPROF_TRACE") == 1;
    config.recordHistory = qEnvironmentVariableIntValue("BUILDPROF_NO_HISTORY") != 1;

    bool ok = false;
    const int threads = qEnvironmentVariableIntValue("BUILDPROF_SCAN_THREADS", &ok);
    if (ok && threads > 0) {
        config.scanThreads = std::min(threads, kMaxScanThreads);
    } else {
        config.scanThreads = defaultScanThreads();
    }
    return config;
}

bool isValidConsoleFormat(const QString &format)
{
    return format == QStringLiteral("table")
        || format == QStringLiteral("json")
        || format == QStringLiteral("markdown");
}

} // namespace buildprof

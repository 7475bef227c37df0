#pragma once

#include <atomic>
#include <istream>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace buildprof {

class ProfilerCli
{
public:
    explicit ProfilerCli(ProfilerConfig config = loadConfigFromEnvironment());

    // CLI dispatcher for profiling runs and run history.
    // returns exit code
    int run(int argc, char *argv[]);

    // Stream read when waiting for a manual build; defaults to std::cin.
    void setInput(std::istream *input) { m_input = input; }
    // Set asynchronously (e.g. by a signal handler) to abort a running scan.
    void setCancelFlag(const std::atomic<bool> *flag) { m_cancelFlag = flag; }

private:
    // Scan, build, rescan, diff, then write the CSV and record the run.
    int runProfile(const QStringList &args);
    int runHistory(const QStringList &args);
    int runShow(const QStringList &args);

    ProfilerConfig m_config;
    std::istream *m_input = nullptr;
    const std::atomic<bool> *m_cancelFlag = nullptr;
};

} // namespace buildprof

#pragma once

#include <QString>

namespace buildprof {

struct BuildResult {
    bool started = false;
    bool crashed = false;
    // Exit status of the shell; -1 when it never started or crashed.
    int exitCode = -1;

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

// Run command through /bin/sh -c inside workingDir with the terminal's
// stdin/stdout/stderr forwarded. Blocks until the command exits.
BuildResult runBuildCommand(const QString &command, const QString &workingDir);

} // namespace buildprof

#include "profiler/build_runner.hpp"

#include <QProcess>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace buildprof {

BuildResult runBuildCommand(const QString &command, const QString &workingDir)
{
    BPLOG_INFO(QStringLiteral("BuildRunner"),
               QStringLiteral("runBuildCommand"),
               QStringLiteral("build_start"),
               QStringLiteral("user_command"),
               QStringLiteral("sh_c"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()},
                               {"cwd", workingDir.toStdString()}}));

    BuildResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.setInputChannelMode(QProcess::ForwardedInputChannel);
    process.setWorkingDirectory(workingDir);
    process.start(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), command});
    if (!process.waitForStarted()) {
        BPLOG_ERROR(QStringLiteral("BuildRunner"),
                    QStringLiteral("runBuildCommand"),
                    QStringLiteral("build_start_failed"),
                    QStringLiteral("process_error"),
                    QStringLiteral("sh_c"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", process.errorString().toStdString()}}));
        return result;
    }
    result.started = true;

    // No timeout: the build runs as long as it needs.
    process.waitForFinished(-1);

    if (process.exitStatus() != QProcess::NormalExit) {
        result.crashed = true;
    } else {
        result.exitCode = process.exitCode();
    }

    const nlohmann::json context{{"exitCode", result.exitCode},
                                 {"crashed", result.crashed}};
    if (result.succeeded()) {
        BPLOG_INFO(QStringLiteral("BuildRunner"),
                   QStringLiteral("runBuildCommand"),
                   QStringLiteral("build_finished"),
                   QStringLiteral("user_command"),
                   QStringLiteral("sh_c"),
                   logging::defaultWho(),
                   QString(),
                   context);
    } else {
        BPLOG_WARN(QStringLiteral("BuildRunner"),
                   QStringLiteral("runBuildCommand"),
                   QStringLiteral("build_failed"),
                   QStringLiteral("nonzero_exit"),
                   QStringLiteral("sh_c"),
                   logging::defaultWho(),
                   QString(),
                   context);
    }
    return result;
}

} // namespace buildprof

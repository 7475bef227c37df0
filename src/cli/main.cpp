#include <QCoreApplication>

#include <atomic>
#include <csignal>
#include <vector>

#include <signal.h>

#include "cli/ProfilerCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace {

std::atomic<bool> g_cancelRequested{false};

void handleInterrupt(int)
{
    g_cancelRequested.store(true);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("buildprof"));

    buildprof::ProfilerConfig config = buildprof::loadConfigFromEnvironment();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    bool afterBuildFlag = false;
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        // Everything after -b belongs to the build command.
        if (!afterBuildFlag && arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        if (arg == QStringLiteral("-b")) {
            afterBuildFlag = true;
        }
        filteredArgs.push_back(arg);
    }
    buildprof::logging::initLogging(QStringLiteral("buildprof"), config.traceEnabled);
    BPLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               buildprof::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()},
                               {"trace", config.traceEnabled}}));

    // No SA_RESTART: a blocking read of the Enter prompt must return on Ctrl-C.
    struct sigaction action {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        BPLOG_WARN(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("signal_handler_failed"),
                   QStringLiteral("startup"),
                   QStringLiteral("sigaction"),
                   buildprof::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    buildprof::ProfilerCli cli(config);
    cli.setCancelFlag(&g_cancelRequested);

    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}

#include "cli/ProfilerCli.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/buildprof_version.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "profiler/build_runner.hpp"
#include "profiler/directory_scanner.hpp"
#include "profiler/profile_store.hpp"
#include "profiler/snapshot_differ.hpp"
#include "report/report_renderer.hpp"

namespace buildprof {

namespace {

constexpr int kExitCancelled = 130;
constexpr const char *kLastRunKey = "last_run_id";

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  buildprof [directory] [options] [-b <build command>]\n"
        "  buildprof history [--limit N] [--format table|json]\n"
        "  buildprof show [--run ID] [--format table|json|markdown|csv]\n"
        "  buildprof -h | --help | help\n"
        "\n"
        "Profiles a build by recording which files under directory were created or\n"
        "modified between a scan before and a scan after the build.\n"
        "\n"
        "Arguments:\n"
        "  directory            Directory to profile (default: current directory).\n"
        "  -b <build command>   Run the command in directory between the scans. Everything\n"
        "                       after -b is taken as the command. Without -b the profiler\n"
        "                       waits for Enter while you run the build yourself.\n"
        "\n"
        "Options:\n"
        "  --out PATH           CSV output file (default: build_profile.csv).\n"
        "  --format FORMAT      Console output: table, json or markdown (default: table).\n"
        "  --threads N          Scanner worker threads.\n"
        "  --no-history         Do not record the run in the history database.\n"
        "  --trace              Write debug trace logs.\n"
        "  --version            Print the version and exit.\n"
        "\n"
        "Environment:\n"
        "  BUILDPROF_TRACE=1, BUILDPROF_SCAN_THREADS=N, BUILDPROF_NO_HISTORY=1\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args, const QString &fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toLower();
}

bool isHelpArg(const QString &arg)
{
    return arg == QStringLiteral("-h") || arg == QStringLiteral("--help")
        || arg == QStringLiteral("help");
}

void printWarning(const ScanWarning &warning)
{
    std::cerr << "Warning: Could not read " << warning.path << " ("
              << warning.reason << ")" << std::endl;
}

// Directory holding logs and the history database; never scanned.
std::string dataDirPath()
{
    const QString dir =
        QFileInfo(QString::fromStdString(ProfileStore::databasePath())).absolutePath();
    const QString canonical = QFileInfo(dir).canonicalFilePath();
    return (canonical.isEmpty() ? dir : canonical).toStdString();
}

} // namespace

ProfilerCli::ProfilerCli(ProfilerConfig config)
    : m_config(std::move(config))
{
}

int ProfilerCli::run(int argc, char *argv[])
{
    // CLI entry: pick history/show subcommands, otherwise profile a directory.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    const QString command = args.size() > 1 ? args.at(1) : QString();
    BPLOG_INFO(QStringLiteral("ProfilerCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()},
                               {"args", args.size()}}));

    if (command == QStringLiteral("history")) {
        return runHistory(args);
    }
    if (command == QStringLiteral("show")) {
        return runShow(args);
    }
    return runProfile(args);
}

int ProfilerCli::runProfile(const QStringList &args)
{
    QStringList positional;
    QString buildCommand;
    bool hasBuildCommand = false;
    ProfilerConfig config = m_config;

    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (isHelpArg(arg)) {
            std::cout << usageText().toStdString();
            return 0;
        }
        if (arg == QStringLiteral("--version")) {
            std::cout << "buildprof " << BUILDPROF_VERSION << std::endl;
            return 0;
        }
        if (arg == QStringLiteral("-b")) {
            if (i + 1 >= args.size() || args.at(i + 1).isEmpty()) {
                std::cerr << "Error: The -b option requires a build command." << std::endl;
                std::cerr << usageText().toStdString();
                return 1;
            }
            buildCommand = args.mid(i + 1).join(QChar(' '));
            hasBuildCommand = true;
            break;
        }
        if (arg == QStringLiteral("--no-history")) {
            config.recordHistory = false;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        if (arg == QStringLiteral("--out") || arg == QStringLiteral("--format")
            || arg == QStringLiteral("--threads")) {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: " << arg.toStdString() << " requires a value."
                          << std::endl;
                return 1;
            }
            const QString value = args.at(++i);
            if (arg == QStringLiteral("--out")) {
                config.outPath = value;
            } else if (arg == QStringLiteral("--format")) {
                config.format = value.toLower();
            } else {
                bool ok = false;
                const int threads = value.toInt(&ok);
                if (!ok || threads < 1) {
                    std::cerr << "Error: --threads expects a positive integer." << std::endl;
                    return 1;
                }
                config.scanThreads = threads;
            }
            continue;
        }
        if (arg.startsWith(QChar('-')) && arg.size() > 1) {
            std::cerr << "Error: Unknown option '" << arg.toStdString() << "'." << std::endl;
            std::cerr << usageText().toStdString();
            return 1;
        }
        positional.push_back(arg);
    }

    if (positional.size() > 1) {
        std::cerr << "Error: Only one target directory can be specified." << std::endl;
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!isValidConsoleFormat(config.format)) {
        std::cerr << "Invalid format. Use table, json or markdown." << std::endl;
        return 1;
    }

    const QString requested = positional.isEmpty() ? QStringLiteral(".") : positional.first();
    const QFileInfo targetInfo(requested);
    const QString targetDir = targetInfo.canonicalFilePath();
    if (targetDir.isEmpty() || !targetInfo.isDir()) {
        std::cerr << "Error: Directory '" << requested.toStdString()
                  << "' does not exist or is not a directory." << std::endl;
        return 1;
    }

    ProfileRun run;
    run.id = ProfileStore::generateRunId();
    run.root = targetDir.toStdString();
    run.buildCommand = buildCommand.toStdString();
    run.startedAt = std::chrono::system_clock::now();

    logging::CorrelationScope correlation(QString::fromStdString(run.id));
    BPLOG_INFO(QStringLiteral("ProfilerCli"),
               QStringLiteral("runProfile"),
               QStringLiteral("profile_start"),
               QStringLiteral("user_invocation"),
               hasBuildCommand ? QStringLiteral("build_command") : QStringLiteral("manual_build"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", run.root},
                               {"out", config.outPath.toStdString()},
                               {"threads", config.scanThreads}}));

    ScanOptions scanOptions;
    scanOptions.threads = config.scanThreads;
    scanOptions.cancelFlag = m_cancelFlag;
    scanOptions.excludedDirs.push_back(dataDirPath());
    scanOptions.onWarning = [&run](const ScanWarning &warning) {
        ++run.skippedFiles;
        printWarning(warning);
    };

    std::cout << "--- Build Profiler ---\n";
    std::cout << "Target: " << run.root << "\n";
    std::cout << "Output: " << config.outPath.toStdString() << "\n\n";

    Snapshot before;
    Snapshot after;
    try {
        std::cout << "STEP 1/3: Initial scan..." << std::endl;
        before = scanDirectory(run.root, scanOptions);
        run.filesBefore = static_cast<int64_t>(before.files.size());
        std::cout << "Scan complete (" << before.files.size() << " files).\n\n";

        if (hasBuildCommand) {
            std::cout << "STEP 2/3: Running build command: " << run.buildCommand << std::endl;
            const BuildResult build = runBuildCommand(buildCommand, targetDir);
            run.buildExitCode = build.exitCode;
            if (!build.started) {
                std::cerr << "WARNING: Build command could not be started." << std::endl;
                std::cerr << "Profiling continues, but results might reflect an incomplete build."
                          << std::endl;
            } else if (!build.succeeded()) {
                if (build.crashed) {
                    std::cerr << "WARNING: Build command terminated abnormally." << std::endl;
                } else {
                    std::cerr << "WARNING: Build command exited with status "
                              << build.exitCode << "." << std::endl;
                }
                std::cerr << "Profiling continues, but results might reflect an incomplete build."
                          << std::endl;
            } else {
                std::cout << "Build completed." << std::endl;
            }
        } else {
            std::cout << "STEP 2/3: Run your build process now." << std::endl;
            std::cout << "Press Enter to continue after build..." << std::flush;
            std::string line;
            std::getline(m_input ? *m_input : std::cin, line);
            if (m_cancelFlag && m_cancelFlag->load()) {
                std::cerr << "\nBuild wait interrupted; no results written." << std::endl;
                return kExitCancelled;
            }
        }
        std::cout << "\n";

        std::cout << "STEP 3/3: Final scan..." << std::endl;
        after = scanDirectory(run.root, scanOptions);
        run.filesAfter = static_cast<int64_t>(after.files.size());
        std::cout << "Scan complete (" << after.files.size() << " files).\n\n";
    } catch (const ScanError &error) {
        if (error.kind() == ScanError::Kind::Cancelled) {
            std::cerr << "Scan interrupted; no results written." << std::endl;
            return kExitCancelled;
        }
        std::cerr << "Error: Failed to scan directory '" << error.path()
                  << "': " << error.what() << std::endl;
        return 1;
    }

    try {
        run.changes = diffSnapshots(before, after);
    } catch (const DiffInputError &error) {
        BPLOG_ERROR(QStringLiteral("ProfilerCli"),
                    QStringLiteral("runProfile"),
                    QStringLiteral("diff_failed"),
                    QStringLiteral("invalid_snapshot"),
                    QStringLiteral("mtime_compare"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"snapshot", error.snapshotId()},
                                    {"path", error.path()}}));
        std::cerr << "Error: " << error.what() << std::endl;
        return 1;
    }
    run.finishedAt = std::chrono::system_clock::now();

    std::cout << "Comparing files and generating CSV..." << std::endl;
    if (!writeCsvFile(config.outPath, run.changes)) {
        std::cerr << "Error: Failed to write '" << config.outPath.toStdString() << "'."
                  << std::endl;
        return 1;
    }
    std::cout << "Build profiling complete. Results saved to '"
              << config.outPath.toStdString() << "'." << std::endl;

    if (config.recordHistory) {
        try {
            ProfileStore store;
            store.addRun(run);
            store.setMeta(kLastRunKey, run.id);
        } catch (const std::exception &ex) {
            BPLOG_WARN(QStringLiteral("ProfilerCli"),
                       QStringLiteral("runProfile"),
                       QStringLiteral("history_write_failed"),
                       QStringLiteral("sqlite_error"),
                       QStringLiteral("sqlite_insert"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", ex.what()}}));
            std::cerr << "WARNING: Could not record run in history: " << ex.what()
                      << std::endl;
        }
    }

    BPLOG_INFO(QStringLiteral("ProfilerCli"),
               QStringLiteral("runProfile"),
               QStringLiteral("profile_complete"),
               QStringLiteral("user_invocation"),
               QStringLiteral("snapshot_diff"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"changes", run.changes.size()},
                               {"skipped", run.skippedFiles},
                               {"buildExitCode", run.buildExitCode}}));

    std::cout << "\n";
    if (config.format == QStringLiteral("json")) {
        std::cout << renderJson(run);
    } else if (config.format == QStringLiteral("markdown")) {
        std::cout << renderMarkdown(run);
    } else {
        std::cout << "--- Build Profile Results ---\n";
        std::cout << renderTable(run.changes);
        std::cout << "---------------------------" << std::endl;
    }
    return 0;
}

int ProfilerCli::runHistory(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("table"));
    if (format != QStringLiteral("table") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use table or json." << std::endl;
        return 1;
    }

    int limit = 0;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit < 0) {
            std::cerr << "Error: --limit expects a non-negative integer." << std::endl;
            return 1;
        }
    }

    try {
        ProfileStore store;
        const auto runs = store.listRuns(limit);
        BPLOG_INFO(QStringLiteral("ProfilerCli"),
                   QStringLiteral("runHistory"),
                   QStringLiteral("history_list"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("sqlite_query"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"runs", runs.size()},
                                   {"format", format.toStdString()}}));
        if (format == QStringLiteral("json")) {
            std::cout << renderHistoryJson(runs);
        } else {
            std::cout << renderHistoryTable(runs);
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to open database: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int ProfilerCli::runShow(const QStringList &args)
{
    const QString format = getFormat(args, QStringLiteral("table"));
    if (!isValidConsoleFormat(format) && format != QStringLiteral("csv")) {
        std::cerr << "Invalid format. Use table, json, markdown or csv." << std::endl;
        return 1;
    }

    try {
        ProfileStore store;
        std::string runId = getArgValue(args, QStringLiteral("--run")).toStdString();
        if (runId.empty()) {
            runId = store.getMeta(kLastRunKey).value_or(std::string());
        }
        if (runId.empty()) {
            std::cerr << "No recorded runs." << std::endl;
            return 1;
        }

        const auto run = store.getRun(runId);
        if (!run.has_value()) {
            std::cerr << "Run not found." << std::endl;
            return 1;
        }

        BPLOG_INFO(QStringLiteral("ProfilerCli"),
                   QStringLiteral("runShow"),
                   QStringLiteral("history_show"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("sqlite_query"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"run", runId},
                                   {"format", format.toStdString()}}));
        if (format == QStringLiteral("json")) {
            std::cout << renderJson(*run);
        } else if (format == QStringLiteral("markdown")) {
            std::cout << renderMarkdown(*run);
        } else if (format == QStringLiteral("csv")) {
            std::cout << renderCsv(run->changes);
        } else {
            std::cout << renderTable(run->changes);
        }
    } catch (const std::exception &ex) {
        std::cerr << "Failed to open database: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace buildprof

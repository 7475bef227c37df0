#include "report/report_renderer.hpp"

#include <algorithm>
#include <sstream>

#include <QByteArray>
#include <QDateTime>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace buildprof {

namespace {

constexpr const char *kCsvHeader = "filepath,last_modification_timestamp";
constexpr const char *kNoChanges = "No changes detected.";

std::string padRight(const std::string &value, size_t width)
{
    if (value.size() >= width) {
        return value;
    }
    return value + std::string(width - value.size(), ' ');
}

std::string buildCommandLabel(const ProfileRun &run)
{
    return run.buildCommand.empty() ? std::string("(manual)") : run.buildCommand;
}

} // namespace

std::string formatLocalTimestamp(int64_t mtimeNs)
{
    const qint64 epochMs = mtimeNs / 1000000;
    const QDateTime local = QDateTime::fromMSecsSinceEpoch(epochMs).toLocalTime();
    return local.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString()
        + " " + local.timeZoneAbbreviation().toStdString();
}

std::string csvEscape(const std::string &value)
{
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '"';
    for (const char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string renderCsv(const std::vector<ChangeRecord> &changes)
{
    std::ostringstream out;
    out << kCsvHeader << "\n";
    for (const auto &change : changes) {
        out << csvEscape(change.path) << ","
            << csvEscape(formatLocalTimestamp(change.newMtimeNs)) << "\n";
    }
    return out.str();
}

bool writeCsvFile(const QString &path, const std::vector<ChangeRecord> &changes)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(renderCsv(changes));
    return file.write(data) == data.size();
}

std::string renderTable(const std::vector<ChangeRecord> &changes)
{
    if (changes.empty()) {
        return std::string(kNoChanges) + "\n";
    }

    const std::string pathHeader = "filepath";
    const std::string timeHeader = "last_modification_timestamp";

    std::vector<std::string> times;
    times.reserve(changes.size());
    size_t pathWidth = pathHeader.size();
    for (const auto &change : changes) {
        pathWidth = std::max(pathWidth, change.path.size());
        times.push_back(formatLocalTimestamp(change.newMtimeNs));
    }

    std::ostringstream out;
    out << padRight(pathHeader, pathWidth) << "  " << timeHeader << "\n";
    for (size_t i = 0; i < changes.size(); ++i) {
        out << padRight(changes[i].path, pathWidth) << "  " << times[i] << "\n";
    }
    return out.str();
}

std::string renderMarkdown(const ProfileRun &run)
{
    std::ostringstream out;
    out << "# Build Profile\n\n";
    out << "Run: " << run.id << "\n";
    out << "Target: " << run.root << "\n";
    out << "Build command: " << buildCommandLabel(run) << "\n";
    out << "Started: " << toIso8601Utc(run.startedAt) << "\n";
    out << "Finished: " << toIso8601Utc(run.finishedAt) << "\n";
    out << "Files scanned: " << run.filesBefore << " -> " << run.filesAfter << "\n";
    if (run.skippedFiles > 0) {
        out << "Skipped entries: " << run.skippedFiles << "\n";
    }
    out << "\n## Changed Files\n\n";

    if (run.changes.empty()) {
        out << kNoChanges << "\n";
        return out.str();
    }

    out << "| File | Change | Last modified |\n";
    out << "|------|--------|---------------|\n";
    for (const auto &change : run.changes) {
        out << "| " << change.path << " | " << toChangeKindString(change.kind)
            << " | " << formatLocalTimestamp(change.newMtimeNs) << " |\n";
    }
    return out.str();
}

std::string renderJson(const ProfileRun &run)
{
    const nlohmann::json payload = run;
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string renderHistoryTable(const std::vector<ProfileRun> &runs)
{
    if (runs.empty()) {
        return "No recorded runs.\n";
    }

    std::ostringstream out;
    for (const auto &run : runs) {
        const auto created = std::count_if(
            run.changes.begin(), run.changes.end(),
            [](const ChangeRecord &change) { return change.kind == ChangeKind::Created; });
        const auto modified = static_cast<long>(run.changes.size()) - created;

        out << run.id << "  " << toIso8601Utc(run.startedAt) << "  " << run.root
            << "  created=" << created << " modified=" << modified;
        if (!run.buildCommand.empty()) {
            out << "  exit=" << run.buildExitCode << "  [" << run.buildCommand << "]";
        }
        out << "\n";
    }
    return out.str();
}

std::string renderHistoryJson(const std::vector<ProfileRun> &runs)
{
    nlohmann::json payload;
    payload["totalRuns"] = runs.size();
    payload["runs"] = runs;
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace buildprof

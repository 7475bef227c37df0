#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace buildprof {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Created:
        return "created";
    case ChangeKind::Modified:
        return "modified";
    }
    return "modified";
}

inline ChangeKind parseChangeKindString(const std::string &value)
{
    if (value == "created") {
        return ChangeKind::Created;
    }
    return ChangeKind::Modified;
}

inline void to_json(nlohmann::json &j, const ChangeKind &kind)
{
    j = toChangeKindString(kind);
}

inline void from_json(const nlohmann::json &j, ChangeKind &kind)
{
    if (j.is_string()) {
        kind = parseChangeKindString(j.get<std::string>());
    } else {
        kind = ChangeKind::Modified;
    }
}

inline void to_json(nlohmann::json &j, const FileRecord &record)
{
    j = nlohmann::json{{"path", record.path}, {"mtimeNs", record.mtimeNs}};
}

inline void from_json(const nlohmann::json &j, FileRecord &record)
{
    record.path = j.value("path", "");
    record.mtimeNs = j.value("mtimeNs", static_cast<int64_t>(0));
}

inline void to_json(nlohmann::json &j, const ChangeRecord &change)
{
    j = nlohmann::json{
        {"path", change.path},
        {"mtimeNs", change.newMtimeNs},
        {"kind", change.kind}
    };
}

inline void from_json(const nlohmann::json &j, ChangeRecord &change)
{
    change.path = j.value("path", "");
    change.newMtimeNs = j.value("mtimeNs", static_cast<int64_t>(0));
    if (j.contains("kind")) {
        change.kind = j.at("kind").get<ChangeKind>();
    } else {
        change.kind = ChangeKind::Modified;
    }
}

inline void to_json(nlohmann::json &j, const ProfileRun &run)
{
    j = nlohmann::json{
        {"id", run.id},
        {"root", run.root},
        {"buildCommand", run.buildCommand},
        {"buildExitCode", run.buildExitCode},
        {"startedAt", toIso8601Utc(run.startedAt)},
        {"finishedAt", toIso8601Utc(run.finishedAt)},
        {"filesBefore", run.filesBefore},
        {"filesAfter", run.filesAfter},
        {"skippedFiles", run.skippedFiles},
        {"changes", run.changes}
    };
}

inline void from_json(const nlohmann::json &j, ProfileRun &run)
{
    run.id = j.value("id", "");
    run.root = j.value("root", "");
    run.buildCommand = j.value("buildCommand", "");
    run.buildExitCode = j.value("buildExitCode", -1);
    run.startedAt = fromIso8601Utc(j.value("startedAt", ""));
    run.finishedAt = fromIso8601Utc(j.value("finishedAt", ""));
    run.filesBefore = j.value("filesBefore", static_cast<int64_t>(0));
    run.filesAfter = j.value("filesAfter", static_cast<int64_t>(0));
    run.skippedFiles = j.value("skippedFiles", static_cast<int64_t>(0));
    if (j.contains("changes") && j.at("changes").is_array()) {
        run.changes = j.at("changes").get<std::vector<ChangeRecord>>();
    } else {
        run.changes.clear();
    }
}

} // namespace buildprof

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace buildprof {

struct FileRecord {
    std::string path;
    // Nanoseconds since the Unix epoch, as reported by lstat().
    int64_t mtimeNs = 0;

    bool operator==(const FileRecord &other) const = default;
};

// Point-in-time view of the regular files under root, sorted by path.
struct Snapshot {
    std::string id;
    std::string root;
    std::chrono::system_clock::time_point timestamp;
    std::vector<FileRecord> files;
};

struct ChangeRecord {
    std::string path;
    int64_t newMtimeNs = 0;
    ChangeKind kind = ChangeKind::Created;

    bool operator==(const ChangeRecord &other) const = default;
};

struct ProfileRun {
    std::string id;
    std::string root;
    std::string buildCommand;
    // -1 when no command was run or it could not be started.
    int buildExitCode = -1;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    int64_t filesBefore = 0;
    int64_t filesAfter = 0;
    int64_t skippedFiles = 0;
    std::vector<ChangeRecord> changes;
};

} // namespace buildprof

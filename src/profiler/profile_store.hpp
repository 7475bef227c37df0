#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace buildprof {

// ProfileStore is the SQLite access layer for recorded profiling runs and
// their change records. The database lives under
// $HOME/.local/share/buildprof/buildprof.db.
class ProfileStore {
public:
    ProfileStore();
    ~ProfileStore();

    static std::string databasePath();
    static std::string generateRunId();

    // Inserts the run and all of its changes in one transaction.
    void addRun(const ProfileRun &run);

    // Most recent first. A limit of 0 returns every run.
    std::vector<ProfileRun> listRuns(int limit = 0) const;
    std::optional<ProfileRun> getRun(const std::string &id) const;
    std::vector<ChangeRecord> getChanges(const std::string &runId) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace buildprof

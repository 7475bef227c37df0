#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace buildprof {

// Raised when a snapshot handed to diffSnapshots() lists a path twice.
class DiffInputError : public std::invalid_argument {
public:
    DiffInputError(std::string snapshotId, std::string path);

    const std::string &snapshotId() const { return m_snapshotId; }
    const std::string &path() const { return m_path; }

private:
    std::string m_snapshotId;
    std::string m_path;
};

/**
 * Compare two snapshots of the same tree.
 *
 * Every path in after that is missing from before is reported as Created,
 * every path whose mtime differs (exact comparison) as Modified, both with
 * the mtime from after. Unchanged paths and paths that only exist in
 * before produce no record.
 *
 * The result is sorted by path whatever the order of the inputs. No I/O.
 */
std::vector<ChangeRecord> diffSnapshots(const Snapshot &before, const Snapshot &after);

} // namespace buildprof

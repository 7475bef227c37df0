#include "profiler/snapshot_differ.hpp"

#include <algorithm>
#include <unordered_map>

namespace buildprof {

namespace {

std::vector<const FileRecord *> sortedView(const Snapshot &snapshot)
{
    std::vector<const FileRecord *> view;
    view.reserve(snapshot.files.size());
    for (const FileRecord &record : snapshot.files) {
        view.push_back(&record);
    }
    std::sort(view.begin(), view.end(),
              [](const FileRecord *a, const FileRecord *b) {
                  return a->path < b->path;
              });

    const auto duplicate = std::adjacent_find(
        view.begin(), view.end(),
        [](const FileRecord *a, const FileRecord *b) {
            return a->path == b->path;
        });
    if (duplicate != view.end()) {
        throw DiffInputError(snapshot.id, (*duplicate)->path);
    }
    return view;
}

} // namespace

DiffInputError::DiffInputError(std::string snapshotId, std::string path)
    : std::invalid_argument("duplicate path in snapshot " + snapshotId + ": " + path)
    , m_snapshotId(std::move(snapshotId))
    , m_path(std::move(path))
{
}

std::vector<ChangeRecord> diffSnapshots(const Snapshot &before, const Snapshot &after)
{
    const auto beforeView = sortedView(before);
    const auto afterView = sortedView(after);

    std::unordered_map<std::string, int64_t> beforeMtimes;
    beforeMtimes.reserve(beforeView.size());
    for (const FileRecord *record : beforeView) {
        beforeMtimes.emplace(record->path, record->mtimeNs);
    }

    std::vector<ChangeRecord> changes;
    for (const FileRecord *record : afterView) {
        const auto it = beforeMtimes.find(record->path);
        if (it == beforeMtimes.end()) {
            changes.push_back({record->path, record->mtimeNs, ChangeKind::Created});
        } else if (it->second != record->mtimeNs) {
            changes.push_back({record->path, record->mtimeNs, ChangeKind::Modified});
        }
    }

    return changes;
}

} // namespace buildprof

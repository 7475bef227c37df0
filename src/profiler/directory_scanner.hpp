#pragma once

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace buildprof {

class ScanError : public std::runtime_error {
public:
    enum class Kind {
        RootUnreadable,
        Cancelled
    };

    ScanError(Kind kind, std::string path, const std::string &message);

    Kind kind() const { return m_kind; }
    const std::string &path() const { return m_path; }

private:
    Kind m_kind;
    std::string m_path;
};

// A file or subdirectory that was skipped because it vanished or could not
// be read while the walk was in progress.
struct ScanWarning {
    std::string path;
    std::string reason;
};

struct ScanOptions {
    // Number of walker threads. Values below 1 are treated as 1.
    int threads = 1;
    // Polled between directory entries; when it becomes true the scan throws
    // ScanError::Kind::Cancelled instead of returning a partial snapshot.
    const std::atomic<bool> *cancelFlag = nullptr;
    // Invoked once per skipped entry. Calls are serialized.
    std::function<void(const ScanWarning &)> onWarning;
    // Absolute directories that are not descended into, e.g. the tool's own
    // data directory. Compared after lexical normalization.
    std::vector<std::string> excludedDirs;
    // Invoked with each regular file as it is enumerated, before its
    // timestamp is read. May be called from several walker threads.
    std::function<void(const std::string &)> onFileFound;
};

/**
 * Walk root recursively and record the mtime of every regular file.
 *
 * - Symlinks are neither followed nor recorded; directories, FIFOs,
 *   sockets and device nodes are excluded.
 * - Timestamps are read with lstat(); nothing under root is modified.
 * - The returned files are sorted by path and unique, independent of the
 *   number of threads.
 *
 * Throws ScanError if root cannot be listed or the scan is cancelled.
 */
Snapshot scanDirectory(const std::string &root, const ScanOptions &options = {});

} // namespace buildprof

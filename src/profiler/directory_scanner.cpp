#include "profiler/directory_scanner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <iterator>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace buildprof {

namespace fs = std::filesystem;

namespace {

constexpr int kCancelCheckInterval = 256;

int64_t mtimeNanos(const struct stat &st)
{
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL
        + static_cast<int64_t>(st.st_mtim.tv_nsec);
}

fs::path normalizeRoot(const std::string &root)
{
    std::error_code error;
    fs::path path = fs::absolute(fs::path(root), error);
    if (error) {
        path = fs::path(root);
    }
    path = path.lexically_normal();
    if (!path.has_filename() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

// Work-queue walker: each job lists one directory, records its regular files
// and queues its subdirectories. With one thread the walk runs inline.
class TreeWalker {
public:
    TreeWalker(fs::path root, const ScanOptions &options, QString corrId)
        : m_root(std::move(root))
        , m_options(options)
        , m_corrId(std::move(corrId))
    {
        for (const std::string &dir : m_options.excludedDirs) {
            m_excluded.push_back(normalizeRoot(dir));
        }
        m_pending.push(m_root);
    }

    std::vector<FileRecord> run()
    {
        const int threads = std::max(1, m_options.threads);
        if (threads == 1) {
            workerLoop();
        } else {
            std::vector<std::thread> workers;
            workers.reserve(threads);
            for (int i = 0; i < threads; ++i) {
                workers.emplace_back(&TreeWalker::workerLoop, this);
            }
            for (std::thread &worker : workers) {
                worker.join();
            }
        }

        if (m_error) {
            std::rethrow_exception(m_error);
        }
        return std::move(m_files);
    }

    int skipped() const { return m_skipped; }

private:
    void workerLoop()
    {
        while (true) {
            fs::path dir;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] {
                    return m_stop || !m_pending.empty() || m_active == 0;
                });
                if (m_stop || m_pending.empty()) {
                    m_cv.notify_all();
                    return;
                }
                dir = std::move(m_pending.front());
                m_pending.pop();
                ++m_active;
            }

            std::vector<FileRecord> files;
            std::vector<fs::path> subdirs;
            try {
                listDirectory(dir, files, subdirs);
            } catch (...) {
                fail(std::current_exception());
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::move(files.begin(), files.end(), std::back_inserter(m_files));
                for (fs::path &subdir : subdirs) {
                    m_pending.push(std::move(subdir));
                }
                --m_active;
            }
            m_cv.notify_all();
        }
    }

    void fail(std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_error) {
            m_error = error;
        }
        m_stop = true;
    }

    bool cancelled() const
    {
        return m_options.cancelFlag && m_options.cancelFlag->load();
    }

    void throwIfCancelled() const
    {
        if (cancelled()) {
            throw ScanError(ScanError::Kind::Cancelled, m_root.string(),
                            "scan cancelled");
        }
    }

    bool stopping()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stop;
    }

    void warn(const fs::path &path, const std::string &reason)
    {
        BPLOG_WARN(QStringLiteral("DirectoryScanner"),
                   QStringLiteral("listDirectory"),
                   QStringLiteral("entry_skipped"),
                   QStringLiteral("vanished_or_unreadable"),
                   QStringLiteral("lstat"),
                   logging::defaultWho(),
                   m_corrId,
                   (nlohmann::json{{"path", path.string()}, {"reason", reason}}));

        std::lock_guard<std::mutex> lock(m_warnMutex);
        ++m_skipped;
        if (m_options.onWarning) {
            m_options.onWarning(ScanWarning{path.string(), reason});
        }
    }

    bool isExcluded(const fs::path &dir) const
    {
        return std::find(m_excluded.begin(), m_excluded.end(), dir.lexically_normal())
            != m_excluded.end();
    }

    void listDirectory(const fs::path &dir,
                       std::vector<FileRecord> &files,
                       std::vector<fs::path> &subdirs)
    {
        throwIfCancelled();
        const bool isRoot = dir == m_root;

        std::error_code error;
        fs::directory_iterator it(dir, error);
        if (error) {
            if (isRoot) {
                throw ScanError(ScanError::Kind::RootUnreadable, dir.string(),
                                error.message());
            }
            warn(dir, error.message());
            return;
        }

        int sinceCheck = 0;
        const fs::directory_iterator end;
        while (it != end) {
            if (++sinceCheck == kCancelCheckInterval) {
                sinceCheck = 0;
                throwIfCancelled();
                if (stopping()) {
                    return;
                }
            }

            const fs::path path = it->path();
            std::error_code typeError;
            const fs::file_status status = it->symlink_status(typeError);
            if (typeError) {
                warn(path, typeError.message());
            } else if (fs::is_directory(status)) {
                if (!isExcluded(path)) {
                    subdirs.push_back(path);
                }
            } else if (fs::is_regular_file(status)) {
                if (m_options.onFileFound) {
                    m_options.onFileFound(path.string());
                }
                struct stat st;
                if (::lstat(path.c_str(), &st) != 0) {
                    warn(path, std::error_code(errno, std::generic_category()).message());
                } else if (S_ISREG(st.st_mode)) {
                    files.push_back(FileRecord{path.string(), mtimeNanos(st)});
                }
            }

            it.increment(error);
            if (error) {
                if (isRoot) {
                    throw ScanError(ScanError::Kind::RootUnreadable, dir.string(),
                                    error.message());
                }
                warn(dir, error.message());
                return;
            }
        }
    }

    const fs::path m_root;
    const ScanOptions &m_options;
    const QString m_corrId;
    std::vector<fs::path> m_excluded;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<fs::path> m_pending;
    int m_active = 0;
    bool m_stop = false;
    std::exception_ptr m_error;
    std::vector<FileRecord> m_files;

    std::mutex m_warnMutex;
    int m_skipped = 0;
};

} // namespace

ScanError::ScanError(Kind kind, std::string path, const std::string &message)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_path(std::move(path))
{
}

Snapshot scanDirectory(const std::string &root, const ScanOptions &options)
{
    const fs::path rootPath = normalizeRoot(root);
    const QString corrId = logging::currentCorrelationId();

    BPLOG_DEBUG(QStringLiteral("DirectoryScanner"),
                QStringLiteral("scanDirectory"),
                QStringLiteral("scan_start"),
                QStringLiteral("profile_step"),
                QStringLiteral("recursive_walk"),
                logging::defaultWho(),
                corrId,
                (nlohmann::json{{"root", rootPath.string()},
                                {"threads", std::max(1, options.threads)}}));

    Snapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             snapshot.timestamp.time_since_epoch())
                             .count();
    snapshot.id = "snapshot-" + std::to_string(epochMs);
    snapshot.root = rootPath.string();

    TreeWalker walker(rootPath, options, corrId);
    try {
        snapshot.files = walker.run();
    } catch (const ScanError &error) {
        BPLOG_ERROR(QStringLiteral("DirectoryScanner"),
                    QStringLiteral("scanDirectory"),
                    error.kind() == ScanError::Kind::Cancelled
                        ? QStringLiteral("scan_cancelled")
                        : QStringLiteral("root_unreadable"),
                    QStringLiteral("scan_failed"),
                    QStringLiteral("recursive_walk"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"root", error.path()},
                                    {"reason", error.what()}}));
        throw;
    }

    std::sort(snapshot.files.begin(), snapshot.files.end(),
              [](const FileRecord &a, const FileRecord &b) {
                  return a.path < b.path;
              });
    snapshot.files.erase(
        std::unique(snapshot.files.begin(), snapshot.files.end(),
                    [](const FileRecord &a, const FileRecord &b) {
                        return a.path == b.path;
                    }),
        snapshot.files.end());

    BPLOG_INFO(QStringLiteral("DirectoryScanner"),
               QStringLiteral("scanDirectory"),
               QStringLiteral("scan_complete"),
               QStringLiteral("profile_step"),
               QStringLiteral("recursive_walk"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"root", snapshot.root},
                               {"snapshotId", snapshot.id},
                               {"files", snapshot.files.size()},
                               {"skipped", walker.skipped()}}));
    return snapshot;
}

} // namespace buildprof

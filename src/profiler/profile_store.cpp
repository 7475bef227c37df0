#include "profiler/profile_store.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

namespace buildprof {

namespace {

constexpr const char *kCreateRunsTable =
    "CREATE TABLE IF NOT EXISTS runs ("
    "    id TEXT PRIMARY KEY,"
    "    root TEXT NOT NULL,"
    "    build_command TEXT,"
    "    build_exit_code INTEGER NOT NULL,"
    "    started_at INTEGER NOT NULL,"
    "    finished_at INTEGER NOT NULL,"
    "    files_before INTEGER NOT NULL,"
    "    files_after INTEGER NOT NULL,"
    "    skipped_files INTEGER NOT NULL"
    ");";

constexpr const char *kCreateChangesTable =
    "CREATE TABLE IF NOT EXISTS changes ("
    "    run_id TEXT NOT NULL,"
    "    path TEXT NOT NULL,"
    "    mtime_ns INTEGER NOT NULL,"
    "    kind INTEGER NOT NULL,"
    "    PRIMARY KEY (run_id, path)"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kSelectRunColumns =
    "SELECT id, root, build_command, build_exit_code, started_at, finished_at, "
    "files_before, files_after, skipped_files FROM runs";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

ChangeKind kindFromInt(int value)
{
    switch (value) {
    case 0:
        return ChangeKind::Created;
    case 1:
        return ChangeKind::Modified;
    default:
        return ChangeKind::Modified;
    }
}

ProfileRun readRunRow(sqlite3_stmt *stmt)
{
    ProfileRun run;
    run.id = columnText(stmt, 0);
    run.root = columnText(stmt, 1);
    run.buildCommand = columnText(stmt, 2);
    run.buildExitCode = sqlite3_column_int(stmt, 3);
    run.startedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 4));
    run.finishedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 5));
    run.filesBefore = sqlite3_column_int64(stmt, 6);
    run.filesAfter = sqlite3_column_int64(stmt, 7);
    run.skippedFiles = sqlite3_column_int64(stmt, 8);
    return run;
}

} // namespace

struct ProfileStore::Impl {
    sqlite3 *db = nullptr;
};

ProfileStore::ProfileStore()
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path dbPath = databasePath();
    std::filesystem::create_directories(dbPath.parent_path());

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        std::string message = "failed to open buildprof database";
        if (impl->db) {
            message += ": ";
            message += sqlite3_errmsg(impl->db);
            sqlite3_close(impl->db);
            impl->db = nullptr;
        }
        throw std::runtime_error(message);
    }

    execOrThrow(impl->db, kCreateRunsTable);
    execOrThrow(impl->db, kCreateChangesTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

ProfileStore::~ProfileStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string ProfileStore::databasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/buildprof";
    return (basePath / "buildprof.db").string();
}

std::string ProfileStore::generateRunId()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << "run-" << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

void ProfileStore::addRun(const ProfileRun &run)
{
    execOrThrow(impl->db, "BEGIN TRANSACTION;");
    try {
        {
            Statement stmt(impl->db,
                           "INSERT OR REPLACE INTO runs (id, root, build_command, "
                           "build_exit_code, started_at, finished_at, files_before, "
                           "files_after, skipped_files) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
            bindText(stmt.get(), 1, run.id);
            bindText(stmt.get(), 2, run.root);
            bindOptionalText(stmt.get(), 3, run.buildCommand);
            sqlite3_bind_int(stmt.get(), 4, run.buildExitCode);
            sqlite3_bind_int64(stmt.get(), 5, toEpochSeconds(run.startedAt));
            sqlite3_bind_int64(stmt.get(), 6, toEpochSeconds(run.finishedAt));
            sqlite3_bind_int64(stmt.get(), 7, run.filesBefore);
            sqlite3_bind_int64(stmt.get(), 8, run.filesAfter);
            sqlite3_bind_int64(stmt.get(), 9, run.skippedFiles);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw std::runtime_error("failed to insert run");
            }
        }

        {
            Statement clear(impl->db, "DELETE FROM changes WHERE run_id = ?;");
            bindText(clear.get(), 1, run.id);
            if (sqlite3_step(clear.get()) != SQLITE_DONE) {
                throw std::runtime_error("failed to clear previous changes");
            }
        }

        Statement stmt(impl->db,
                       "INSERT INTO changes (run_id, path, mtime_ns, kind) "
                       "VALUES (?, ?, ?, ?);");
        for (const ChangeRecord &change : run.changes) {
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
            bindText(stmt.get(), 1, run.id);
            bindText(stmt.get(), 2, change.path);
            sqlite3_bind_int64(stmt.get(), 3, change.newMtimeNs);
            sqlite3_bind_int(stmt.get(), 4, static_cast<int>(change.kind));
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw std::runtime_error("failed to insert change for " + change.path);
            }
        }
    } catch (const std::exception &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    execOrThrow(impl->db, "COMMIT;");
}

std::vector<ProfileRun> ProfileStore::listRuns(int limit) const
{
    std::string sql = kSelectRunColumns;
    sql += " ORDER BY started_at DESC, rowid DESC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    Statement stmt(impl->db, sql.c_str());
    if (limit > 0) {
        sqlite3_bind_int(stmt.get(), 1, limit);
    }

    std::vector<ProfileRun> runs;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        runs.push_back(readRunRow(stmt.get()));
    }
    for (ProfileRun &run : runs) {
        run.changes = getChanges(run.id);
    }
    return runs;
}

std::optional<ProfileRun> ProfileStore::getRun(const std::string &id) const
{
    std::string sql = kSelectRunColumns;
    sql += " WHERE id = ?;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    ProfileRun run = readRunRow(stmt.get());
    run.changes = getChanges(run.id);
    return run;
}

std::vector<ChangeRecord> ProfileStore::getChanges(const std::string &runId) const
{
    Statement stmt(impl->db,
                   "SELECT path, mtime_ns, kind FROM changes "
                   "WHERE run_id = ? ORDER BY path ASC;");
    bindText(stmt.get(), 1, runId);

    std::vector<ChangeRecord> changes;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ChangeRecord change;
        change.path = columnText(stmt.get(), 0);
        change.newMtimeNs = sqlite3_column_int64(stmt.get(), 1);
        change.kind = kindFromInt(sqlite3_column_int(stmt.get(), 2));
        changes.push_back(std::move(change));
    }
    return changes;
}

std::optional<std::string> ProfileStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ?;");
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void ProfileStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to write meta");
    }
}

} // namespace buildprof

#pragma once

#include "core/shared/types.h"

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace dd {

// CommandStore -- durable, append-only shell history backed by SQLite.
//
// One writer connection serializes every mutation behind m_writeMutex.
// Reads go through a small pool of read-only WAL connections, so history
// lookups never wait on an in-flight insert.
//
// Read methods return nullopt on SQLite failure and an empty vector when
// nothing matched.
class CommandStore {
public:
    static constexpr int kDefaultReadConnections = 4;

    ~CommandStore();

    CommandStore(const CommandStore&) = delete;
    CommandStore& operator=(const CommandStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open. Returns nullptr when
    // the file cannot be opened or fails its integrity check.
    static std::unique_ptr<CommandStore> open(const QString& dbPath,
                                              int readConnections = kDefaultReadConnections);

    // ── Writes ──────────────────────────────────────────────

    // Append one record. The row is committed before the id is returned.
    // Negative durations are stored as 0. A missing timestamp means "now".
    std::optional<int64_t> log(const QString& command,
                               const QString& cwd,
                               int exitCode,
                               double durationSeconds,
                               const QString& sessionId = {},
                               std::optional<double> timestamp = std::nullopt);

    // Delete every record older than beforeTimestamp. Returns rows removed.
    std::optional<int> prune(double beforeTimestamp);

    // ── Reads ───────────────────────────────────────────────

    // Case-insensitive prefix match (full Unicode case folding), most recent
    // first. A cwd filter matches the directory itself and everything below
    // it. successfulOnly restricts to exit code 0.
    std::optional<std::vector<CommandRecord>> searchPrefix(const QString& partial,
                                                           const QString& cwdFilter,
                                                           int limit,
                                                           bool successfulOnly = false);

    // Token match over the FTS5 index. All tokens must match; when that
    // yields nothing any token may match. Ranked by BM25 plus a recency
    // bonus, ties broken most recent first.
    std::optional<std::vector<CommandRecord>> searchText(const QString& query, int limit);

    std::optional<std::vector<CommandRecord>> recent(int limit, const QString& cwdFilter = {});

    std::optional<CommandRecord> getById(int64_t id);

    struct CommandSummary {
        QString command;
        int64_t lastId = 0;
        int useCount = 0;
        double lastUsed = 0.0;
    };

    // Distinct command texts ordered by last use.
    std::optional<std::vector<CommandSummary>> distinctRecent(int limit, bool successfulOnly = false);

    // Distinct command texts ordered by use count.
    std::optional<std::vector<CommandSummary>> topCommands(int limit);

    struct DirectoryUsage {
        QString cwd;
        int useCount = 0;
    };

    std::optional<std::vector<DirectoryUsage>> topDirectories(int limit);

    struct Statistics {
        int64_t totalCommands = 0;
        int64_t successfulCommands = 0;
        double successRate = 0.0;
        int64_t uniqueCommands = 0;
        int64_t sessions = 0;
        double oldestTimestamp = 0.0;
        double newestTimestamp = 0.0;
        int64_t databaseBytes = 0;
    };

    std::optional<Statistics> statistics();

    // ── Maintenance ─────────────────────────────────────────

    bool integrityCheck();
    const QString& path() const { return m_dbPath; }

    static QString escapeLikePattern(const QString& raw);
    static QString buildFtsQuery(const QString& raw, bool relaxed);

private:
    CommandStore() = default;
    bool init(const QString& dbPath, int readConnections);

    // RAII checkout of one read connection from the pool.
    class ReadLease {
    public:
        explicit ReadLease(CommandStore& store);
        ~ReadLease();
        ReadLease(const ReadLease&) = delete;
        ReadLease& operator=(const ReadLease&) = delete;
        sqlite3* db() const { return m_db; }

    private:
        CommandStore& m_store;
        sqlite3* m_db = nullptr;
    };

    sqlite3* acquireReader();
    void releaseReader(sqlite3* db);

    std::optional<std::vector<CommandRecord>> runTextQuery(const QString& ftsQuery, int limit);

    static bool execSql(sqlite3* db, const char* sql);

    QString m_dbPath;

    sqlite3* m_writer = nullptr;
    std::mutex m_writeMutex;

    std::vector<sqlite3*> m_readers;
    std::vector<sqlite3*> m_idleReaders;
    std::mutex m_readerMutex;
    std::condition_variable m_readerAvailable;
};

} // namespace dd

#include "core/history/command_store.h"
#include "core/history/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>
#include <QThread>

#include <algorithm>
#include <cmath>

namespace dd {

namespace {

constexpr const char* kRecordColumns =
    "id, command, cwd, exit_code, duration, timestamp, session_id";

// Relevance bonus for a command run just now; decays with age in days.
constexpr double kRecencyWeight = 0.5;
constexpr int kMaxFtsTokens = 8;

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

CommandRecord readRecord(sqlite3_stmt* stmt, int offset = 0)
{
    CommandRecord record;
    record.id = sqlite3_column_int64(stmt, offset + 0);
    record.command = columnText(stmt, offset + 1);
    record.workingDirectory = columnText(stmt, offset + 2);
    record.exitCode = sqlite3_column_int(stmt, offset + 3);
    record.durationSeconds = sqlite3_column_double(stmt, offset + 4);
    record.timestamp = sqlite3_column_double(stmt, offset + 5);
    record.sessionId = columnText(stmt, offset + 6);
    return record;
}

// Writers can hit SQLITE_BUSY while a reader holds the WAL during checkpoint.
int stepWithRetry(sqlite3_stmt* stmt)
{
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

// "" when no filter applies (empty or filesystem root).
QString normalizedCwdFilter(const QString& cwdFilter)
{
    const QString trimmed = cwdFilter.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    const QString cleaned = QDir::cleanPath(trimmed);
    if (cleaned == QLatin1String("/")) {
        return {};
    }
    return cleaned;
}

void appendCwdClause(QString& sql, int& bindIndex, const QString& cwd,
                     std::vector<QByteArray>& binds)
{
    if (cwd.isEmpty()) {
        return;
    }
    sql += QStringLiteral(" AND (cwd = ?%1 OR cwd LIKE ?%2 ESCAPE '\\')")
               .arg(bindIndex).arg(bindIndex + 1);
    bindIndex += 2;
    binds.push_back(cwd.toUtf8());
    binds.push_back((CommandStore::escapeLikePattern(cwd + QLatin1Char('/'))
                     + QLatin1Char('%')).toUtf8());
}

// casefold(text): Unicode case folding for prefix matching. SQLite's own
// LIKE and lower() only fold ASCII.
void casefoldFunction(sqlite3_context* context, int argc, sqlite3_value** argv)
{
    if (argc != 1 || sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(context);
        return;
    }
    const char* text = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    const QByteArray folded = QString::fromUtf8(text).toCaseFolded().toUtf8();
    sqlite3_result_text(context, folded.constData(), folded.size(), SQLITE_TRANSIENT);
}

} // namespace

// ── Lifecycle ───────────────────────────────────────────────

CommandStore::~CommandStore()
{
    for (sqlite3* reader : m_readers) {
        sqlite3_close(reader);
    }
    m_readers.clear();
    m_idleReaders.clear();

    if (m_writer) {
        sqlite3_close(m_writer);
        m_writer = nullptr;
    }
}

std::unique_ptr<CommandStore> CommandStore::open(const QString& dbPath, int readConnections)
{
    std::unique_ptr<CommandStore> store(new CommandStore());
    if (!store->init(dbPath, std::max(readConnections, 1))) {
        return nullptr;
    }
    return store;
}

bool CommandStore::init(const QString& dbPath, int readConnections)
{
    m_dbPath = dbPath;
    const QByteArray pathUtf8 = dbPath.toUtf8();

    const QString parentDir = QFileInfo(dbPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ddStore, "Failed to create database directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    int rc = sqlite3_open_v2(pathUtf8.constData(), &m_writer,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ddStore, "Failed to open database: %s",
                  m_writer ? sqlite3_errmsg(m_writer) : sqlite3_errstr(rc));
        return false;
    }

    sqlite3_busy_timeout(m_writer, 5000);

    if (!execSql(m_writer, kConnectionPragmas)) {
        LOG_ERROR(ddStore, "Failed to set connection pragmas");
        return false;
    }

    int userVersion = 0;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_writer, "PRAGMA user_version", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    if (userVersion > kCurrentSchemaVersion) {
        LOG_ERROR(ddStore, "Database schema version %d is newer than supported %d",
                  userVersion, kCurrentSchemaVersion);
        return false;
    }

    if (userVersion == 0) {
        if (!execSql(m_writer, kDatabasePragmas)) {
            LOG_ERROR(ddStore, "Failed to set database pragmas");
            return false;
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_writer, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            const QString mode = columnText(stmt, 0);
            if (mode != QLatin1String("wal")) {
                LOG_WARN(ddStore, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
            }
        }
        sqlite3_finalize(stmt);
    }

    if (!execSql(m_writer, kSchemaV1)) {
        LOG_ERROR(ddStore, "Failed to create schema");
        return false;
    }

    if (!integrityCheck()) {
        LOG_ERROR(ddStore, "Database failed integrity check: %s", qUtf8Printable(dbPath));
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    for (const QString& suffix : {QString(), QStringLiteral("-wal"), QStringLiteral("-shm")}) {
        QFile file(dbPath + suffix);
        if (file.exists()) {
            file.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
        }
    }

    for (int i = 0; i < readConnections; ++i) {
        sqlite3* reader = nullptr;
        rc = sqlite3_open_v2(pathUtf8.constData(), &reader,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR(ddStore, "Failed to open read connection %d: %s", i,
                      reader ? sqlite3_errmsg(reader) : sqlite3_errstr(rc));
            sqlite3_close(reader);
            return false;
        }
        m_readers.push_back(reader);
        if (!execSql(reader, kReaderPragmas)) {
            LOG_ERROR(ddStore, "Failed to set pragmas on read connection %d", i);
            return false;
        }
        if (sqlite3_create_function_v2(reader, "casefold", 1,
                                       SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                       casefoldFunction, nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR(ddStore, "Failed to register casefold on read connection %d: %s", i,
                      sqlite3_errmsg(reader));
            return false;
        }
        m_idleReaders.push_back(reader);
    }

    LOG_INFO(ddStore, "History database opened: %s (%d readers)",
             qUtf8Printable(dbPath), readConnections);
    return true;
}

bool CommandStore::execSql(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ddStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Reader pool ─────────────────────────────────────────────

CommandStore::ReadLease::ReadLease(CommandStore& store)
    : m_store(store)
    , m_db(store.acquireReader())
{
}

CommandStore::ReadLease::~ReadLease()
{
    m_store.releaseReader(m_db);
}

sqlite3* CommandStore::acquireReader()
{
    std::unique_lock<std::mutex> lock(m_readerMutex);
    m_readerAvailable.wait(lock, [this]() { return !m_idleReaders.empty(); });
    sqlite3* db = m_idleReaders.back();
    m_idleReaders.pop_back();
    return db;
}

void CommandStore::releaseReader(sqlite3* db)
{
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_idleReaders.push_back(db);
    }
    m_readerAvailable.notify_one();
}

// ── Writes ──────────────────────────────────────────────────

std::optional<int64_t> CommandStore::log(const QString& command,
                                         const QString& cwd,
                                         int exitCode,
                                         double durationSeconds,
                                         const QString& sessionId,
                                         std::optional<double> timestamp)
{
    if (command.trimmed().isEmpty()) {
        LOG_WARN(ddStore, "Refusing to log an empty command");
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO commands (command, cwd, exit_code, duration, timestamp, session_id)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    std::lock_guard<std::mutex> lock(m_writeMutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_writer, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "log prepare failed: %s", sqlite3_errmsg(m_writer));
        return std::nullopt;
    }

    const QByteArray commandUtf8 = command.toUtf8();
    const QByteArray cwdUtf8 = cwd.toUtf8();
    const QByteArray sessionUtf8 = sessionId.toUtf8();
    const double duration = std::isfinite(durationSeconds) ? std::max(durationSeconds, 0.0) : 0.0;

    sqlite3_bind_text(stmt, 1, commandUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, cwdUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, exitCode);
    sqlite3_bind_double(stmt, 4, duration);
    sqlite3_bind_double(stmt, 5, timestamp.value_or(nowSeconds()));
    if (sessionId.isEmpty()) {
        sqlite3_bind_null(stmt, 6);
    } else {
        sqlite3_bind_text(stmt, 6, sessionUtf8.constData(), -1, SQLITE_STATIC);
    }

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "log step failed: %s", sqlite3_errmsg(m_writer));
        return std::nullopt;
    }

    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_writer));
}

std::optional<int> CommandStore::prune(double beforeTimestamp)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_writer, "DELETE FROM commands WHERE timestamp < ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "prune prepare failed: %s", sqlite3_errmsg(m_writer));
        return std::nullopt;
    }
    sqlite3_bind_double(stmt, 1, beforeTimestamp);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "prune step failed: %s", sqlite3_errmsg(m_writer));
        return std::nullopt;
    }

    const int removed = sqlite3_changes(m_writer);
    if (removed > 0) {
        LOG_INFO(ddStore, "Pruned %d record(s) older than %.0f", removed, beforeTimestamp);
    }
    return removed;
}

// ── Reads ───────────────────────────────────────────────────

std::optional<std::vector<CommandRecord>> CommandStore::searchPrefix(const QString& partial,
                                                                     const QString& cwdFilter,
                                                                     int limit,
                                                                     bool successfulOnly)
{
    std::vector<CommandRecord> records;
    if (limit <= 0) {
        return records;
    }

    QString sql = QStringLiteral("SELECT %1 FROM commands WHERE casefold(command) LIKE ?1 ESCAPE '\\'")
                      .arg(QLatin1String(kRecordColumns));
    if (successfulOnly) {
        sql += QStringLiteral(" AND exit_code = 0");
    }
    int bindIndex = 2;
    std::vector<QByteArray> binds;
    binds.push_back((escapeLikePattern(partial.toCaseFolded()) + QLatin1Char('%')).toUtf8());
    appendCwdClause(sql, bindIndex, normalizedCwdFilter(cwdFilter), binds);
    sql += QStringLiteral(" ORDER BY timestamp DESC, id DESC LIMIT ?%1").arg(bindIndex);

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    const QByteArray sqlUtf8 = sql.toUtf8();
    if (sqlite3_prepare_v2(lease.db(), sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "searchPrefix prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }

    for (size_t i = 0; i < binds.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i) + 1, binds[i].constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, bindIndex, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(readRecord(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "searchPrefix step failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return records;
}

std::optional<std::vector<CommandRecord>> CommandStore::searchText(const QString& query, int limit)
{
    if (limit <= 0) {
        return std::vector<CommandRecord>();
    }

    const QString strict = buildFtsQuery(query, false);
    if (strict.isEmpty()) {
        LOG_DEBUG(ddStore, "FTS5 search skipped after sanitization");
        return std::vector<CommandRecord>();
    }

    auto hits = runTextQuery(strict, limit);
    if (!hits || !hits->empty()) {
        return hits;
    }

    const QString relaxed = buildFtsQuery(query, true);
    if (relaxed == strict) {
        return hits;
    }
    LOG_DEBUG(ddStore, "FTS5 strict query empty, retrying relaxed: %s", qUtf8Printable(relaxed));
    return runTextQuery(relaxed, limit);
}

std::optional<std::vector<CommandRecord>> CommandStore::runTextQuery(const QString& ftsQuery,
                                                                     int limit)
{
    // Over-fetch by BM25 so the recency bonus can reorder the head.
    const int poolSize = std::max(limit * 4, 50);

    const char* sql = R"(
        SELECT c.id, c.command, c.cwd, c.exit_code, c.duration, c.timestamp, c.session_id,
               bm25(commands_fts) AS rank
        FROM commands_fts
        JOIN commands c ON c.id = commands_fts.rowid
        WHERE commands_fts MATCH ?1
        ORDER BY rank
        LIMIT ?2
    )";

    struct ScoredRecord {
        CommandRecord record;
        double score = 0.0;
    };
    std::vector<ScoredRecord> scored;

    {
        ReadLease lease(*this);
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(lease.db(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(ddStore, "searchText prepare failed: %s", sqlite3_errmsg(lease.db()));
            return std::nullopt;
        }

        const QByteArray queryUtf8 = ftsQuery.toUtf8();
        sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, poolSize);

        const double now = nowSeconds();
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ScoredRecord entry;
            entry.record = readRecord(stmt);
            const double bm25 = sqlite3_column_double(stmt, 7);
            const double ageDays = std::max(0.0, now - entry.record.timestamp) / 86400.0;
            entry.score = -bm25 + kRecencyWeight / (1.0 + ageDays);
            scored.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            LOG_ERROR(ddStore, "searchText step failed: %s", sqlite3_errmsg(lease.db()));
            return std::nullopt;
        }
    }

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredRecord& a, const ScoredRecord& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.record.timestamp != b.record.timestamp) {
            return a.record.timestamp > b.record.timestamp;
        }
        return a.record.id > b.record.id;
    });

    std::vector<CommandRecord> records;
    records.reserve(std::min(scored.size(), static_cast<size_t>(limit)));
    for (const ScoredRecord& entry : scored) {
        if (static_cast<int>(records.size()) >= limit) {
            break;
        }
        records.push_back(entry.record);
    }
    return records;
}

std::optional<std::vector<CommandRecord>> CommandStore::recent(int limit, const QString& cwdFilter)
{
    std::vector<CommandRecord> records;
    if (limit <= 0) {
        return records;
    }

    QString sql = QStringLiteral("SELECT %1 FROM commands WHERE 1 = 1")
                      .arg(QLatin1String(kRecordColumns));
    int bindIndex = 1;
    std::vector<QByteArray> binds;
    appendCwdClause(sql, bindIndex, normalizedCwdFilter(cwdFilter), binds);
    sql += QStringLiteral(" ORDER BY timestamp DESC, id DESC LIMIT ?%1").arg(bindIndex);

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    const QByteArray sqlUtf8 = sql.toUtf8();
    if (sqlite3_prepare_v2(lease.db(), sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "recent prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }

    for (size_t i = 0; i < binds.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i) + 1, binds[i].constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, bindIndex, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(readRecord(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "recent step failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return records;
}

std::optional<CommandRecord> CommandStore::getById(int64_t id)
{
    const QByteArray sql = QStringLiteral("SELECT %1 FROM commands WHERE id = ?1")
                               .arg(QLatin1String(kRecordColumns)).toUtf8();

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(lease.db(), sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "getById prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<CommandRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = readRecord(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::optional<std::vector<CommandStore::CommandSummary>> CommandStore::distinctRecent(
    int limit, bool successfulOnly)
{
    std::vector<CommandSummary> summaries;
    if (limit <= 0) {
        return summaries;
    }

    const char* sqlAll = R"(
        SELECT command, MAX(id), COUNT(*), MAX(timestamp) AS last_used
        FROM commands
        GROUP BY command
        ORDER BY last_used DESC, MAX(id) DESC
        LIMIT ?1
    )";
    const char* sqlSuccessful = R"(
        SELECT command, MAX(id), COUNT(*), MAX(timestamp) AS last_used
        FROM commands
        WHERE exit_code = 0
        GROUP BY command
        ORDER BY last_used DESC, MAX(id) DESC
        LIMIT ?1
    )";

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(lease.db(), successfulOnly ? sqlSuccessful : sqlAll,
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "distinctRecent prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        CommandSummary summary;
        summary.command = columnText(stmt, 0);
        summary.lastId = sqlite3_column_int64(stmt, 1);
        summary.useCount = sqlite3_column_int(stmt, 2);
        summary.lastUsed = sqlite3_column_double(stmt, 3);
        summaries.push_back(std::move(summary));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "distinctRecent step failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return summaries;
}

std::optional<std::vector<CommandStore::CommandSummary>> CommandStore::topCommands(int limit)
{
    std::vector<CommandSummary> summaries;
    if (limit <= 0) {
        return summaries;
    }

    const char* sql = R"(
        SELECT command, MAX(id), COUNT(*) AS uses, MAX(timestamp) AS last_used
        FROM commands
        GROUP BY command
        ORDER BY uses DESC, last_used DESC, command ASC
        LIMIT ?1
    )";

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(lease.db(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "topCommands prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        CommandSummary summary;
        summary.command = columnText(stmt, 0);
        summary.lastId = sqlite3_column_int64(stmt, 1);
        summary.useCount = sqlite3_column_int(stmt, 2);
        summary.lastUsed = sqlite3_column_double(stmt, 3);
        summaries.push_back(std::move(summary));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "topCommands step failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return summaries;
}

std::optional<std::vector<CommandStore::DirectoryUsage>> CommandStore::topDirectories(int limit)
{
    std::vector<DirectoryUsage> usage;
    if (limit <= 0) {
        return usage;
    }

    const char* sql = R"(
        SELECT cwd, COUNT(*) AS uses
        FROM commands
        WHERE cwd != ''
        GROUP BY cwd
        ORDER BY uses DESC, cwd ASC
        LIMIT ?1
    )";

    ReadLease lease(*this);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(lease.db(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ddStore, "topDirectories prepare failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DirectoryUsage entry;
        entry.cwd = columnText(stmt, 0);
        entry.useCount = sqlite3_column_int(stmt, 1);
        usage.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(ddStore, "topDirectories step failed: %s", sqlite3_errmsg(lease.db()));
        return std::nullopt;
    }
    return usage;
}

std::optional<CommandStore::Statistics> CommandStore::statistics()
{
    const char* sql = R"(
        SELECT COUNT(*),
               COALESCE(SUM(CASE WHEN exit_code = 0 THEN 1 ELSE 0 END), 0),
               COUNT(DISTINCT command),
               COUNT(DISTINCT session_id),
               COALESCE(MIN(timestamp), 0),
               COALESCE(MAX(timestamp), 0)
        FROM commands
    )";

    Statistics stats;
    {
        ReadLease lease(*this);
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(lease.db(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(ddStore, "statistics prepare failed: %s", sqlite3_errmsg(lease.db()));
            return std::nullopt;
        }
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            LOG_ERROR(ddStore, "statistics step failed: %s", sqlite3_errmsg(lease.db()));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        stats.totalCommands = sqlite3_column_int64(stmt, 0);
        stats.successfulCommands = sqlite3_column_int64(stmt, 1);
        stats.uniqueCommands = sqlite3_column_int64(stmt, 2);
        stats.sessions = sqlite3_column_int64(stmt, 3);
        stats.oldestTimestamp = sqlite3_column_double(stmt, 4);
        stats.newestTimestamp = sqlite3_column_double(stmt, 5);
        sqlite3_finalize(stmt);
    }

    if (stats.totalCommands > 0) {
        stats.successRate = static_cast<double>(stats.successfulCommands)
            / static_cast<double>(stats.totalCommands);
    }

    stats.databaseBytes = QFileInfo(m_dbPath).size();
    const QFileInfo walInfo(m_dbPath + QStringLiteral("-wal"));
    if (walInfo.exists()) {
        stats.databaseBytes += walInfo.size();
    }
    return stats;
}

// ── Maintenance ─────────────────────────────────────────────

bool CommandStore::integrityCheck()
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_writer, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ok = columnText(stmt, 0) == QLatin1String("ok");
    }
    sqlite3_finalize(stmt);
    return ok;
}

QString CommandStore::escapeLikePattern(const QString& raw)
{
    QString escaped;
    escaped.reserve(raw.size());
    for (const QChar ch : raw) {
        if (ch == QLatin1Char('\\') || ch == QLatin1Char('%') || ch == QLatin1Char('_')) {
            escaped.append(QLatin1Char('\\'));
        }
        escaped.append(ch);
    }
    return escaped;
}

QString CommandStore::buildFtsQuery(const QString& raw, bool relaxed)
{
    const QString normalized = raw.toLower().trimmed();
    if (normalized.isEmpty()) {
        return {};
    }

    static const QRegularExpression tokenRegex(QStringLiteral(R"([\p{L}\p{N}_]+)"));

    QStringList tokens;
    QSet<QString> seen;
    auto matchIt = tokenRegex.globalMatch(normalized);
    while (matchIt.hasNext()) {
        const QString token = matchIt.next().captured(0);
        if (seen.contains(token)) {
            continue;
        }
        seen.insert(token);
        // Quoted so FTS5 operators in user input stay literal; * allows
        // "stat" to reach "status".
        tokens.append(QLatin1Char('"') + token + QStringLiteral("\"*"));
        if (tokens.size() >= kMaxFtsTokens) {
            break;
        }
    }

    if (tokens.isEmpty()) {
        return {};
    }
    return tokens.join(relaxed ? QStringLiteral(" OR ") : QStringLiteral(" "));
}

} // namespace dd

#pragma once

namespace dd {

// Writer connection pragmas.
// synchronous = FULL so a committed log() survives power loss under WAL.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = FULL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
PRAGMA journal_size_limit = 16777216;
)";

// Read-only pool connections.
constexpr const char* kReaderPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA cache_size = -16384;
PRAGMA query_only = ON;
)";

// Database-level pragmas, run once by the writer when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x444448;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

// AUTOINCREMENT keeps ids monotonic across prune(); rowids of deleted
// rows are never handed out again.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS commands (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    command TEXT NOT NULL,
    cwd TEXT NOT NULL DEFAULT '',
    exit_code INTEGER NOT NULL DEFAULT 0,
    duration REAL NOT NULL DEFAULT 0,
    timestamp REAL NOT NULL,
    session_id TEXT
);

CREATE INDEX IF NOT EXISTS idx_commands_timestamp ON commands(timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_commands_cwd ON commands(cwd);
CREATE INDEX IF NOT EXISTS idx_commands_command ON commands(command);
CREATE INDEX IF NOT EXISTS idx_commands_session ON commands(session_id);

CREATE VIRTUAL TABLE IF NOT EXISTS commands_fts USING fts5(
    command,
    content = 'commands',
    content_rowid = 'id',
    tokenize = 'unicode61'
);

CREATE TRIGGER IF NOT EXISTS commands_fts_insert AFTER INSERT ON commands BEGIN
    INSERT INTO commands_fts(rowid, command) VALUES (new.id, new.command);
END;

CREATE TRIGGER IF NOT EXISTS commands_fts_delete AFTER DELETE ON commands BEGIN
    INSERT INTO commands_fts(commands_fts, rowid, command)
    VALUES ('delete', old.id, old.command);
END;
)";

} // namespace dd

#pragma once

namespace st {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

// impressions_v1 is written by the logging collaborator and only read by
// training. weight_versions is append-only; weight_state holds the single
// active pointer.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS impressions_v1 (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT NOT NULL,
    trip_id INTEGER NOT NULL,
    position INTEGER NOT NULL,
    clicked INTEGER NOT NULL DEFAULT 0,
    dwell_seconds REAL,
    converted INTEGER,
    bot_flagged INTEGER NOT NULL DEFAULT 0,
    schema_version INTEGER NOT NULL,
    features_json TEXT NOT NULL,
    created_at_ms INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_impressions_created
    ON impressions_v1(created_at_ms);
CREATE INDEX IF NOT EXISTS idx_impressions_session
    ON impressions_v1(session_id);

CREATE TABLE IF NOT EXISTS weight_versions (
    version INTEGER PRIMARY KEY,
    created_at_ms INTEGER NOT NULL,
    schema_version INTEGER NOT NULL,
    source TEXT NOT NULL DEFAULT '',
    validation_loss REAL,
    weights_json TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS weight_state (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr int kCurrentSchemaVersion = 1;

} // namespace st

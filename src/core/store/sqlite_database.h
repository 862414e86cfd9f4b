#pragma once

#include "core/shared/errors.h"

#include <QString>

#include <optional>

#include <sqlite3.h>

namespace st {

// Owner of one SQLite connection holding the impression log and the weight
// history. Components borrow the raw handle; all of them run their
// statements under the owner's lifetime.
class SqliteDatabase {
public:
    ~SqliteDatabase();

    // Move-only (owns sqlite3* handle)
    SqliteDatabase(SqliteDatabase&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SqliteDatabase& operator=(SqliteDatabase&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // Open or create the database at the given path (":memory:" works).
    // Creates the schema and sets pragmas on first open.
    static std::optional<SqliteDatabase> open(const QString& dbPath, Error* errorOut = nullptr);

    sqlite3* handle() const { return m_db; }

    bool exec(const char* sql, Error* errorOut = nullptr);

private:
    SqliteDatabase() = default;
    bool init(const QString& dbPath, Error* errorOut);

    sqlite3* m_db = nullptr;
};

// Statement-level helper shared by the sqlite-backed components.
bool execSql(sqlite3* db, const char* sql, Error* errorOut = nullptr);

} // namespace st

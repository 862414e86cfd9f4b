#include "core/store/sqlite_database.h"
#include "core/shared/logging.h"
#include "core/store/schema.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace st {

bool execSql(sqlite3* db, const char* sql, Error* errorOut)
{
    if (!db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("database not open"));
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        LOG_ERROR(stStore, "SQL error: %s", qUtf8Printable(message));
        return fail(errorOut, ErrorKind::Persistence, message);
    }
    return true;
}

SqliteDatabase::~SqliteDatabase()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SqliteDatabase> SqliteDatabase::open(const QString& dbPath, Error* errorOut)
{
    SqliteDatabase database;
    if (!database.init(dbPath, errorOut)) {
        return std::nullopt;
    }
    return database;
}

bool SqliteDatabase::exec(const char* sql, Error* errorOut)
{
    return execSql(m_db, sql, errorOut);
}

bool SqliteDatabase::init(const QString& dbPath, Error* errorOut)
{
    const bool inMemory = dbPath == QLatin1String(":memory:");
    if (!inMemory) {
        const QString parentDir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            LOG_ERROR(stStore, "Failed to create database directory: %s", qUtf8Printable(parentDir));
            return fail(errorOut, ErrorKind::Persistence,
                        QStringLiteral("cannot create %1").arg(parentDir));
        }
    }

    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_ERROR(stStore, "Failed to open database: %s", qUtf8Printable(message));
        return fail(errorOut, ErrorKind::Persistence, message);
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!exec(kConnectionPragmas, errorOut)) {
        LOG_ERROR(stStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='weight_versions'",
                -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!inMemory && !exec(kDatabasePragmas, errorOut)) {
            LOG_ERROR(stStore, "Failed to set database pragmas");
            return false;
        }
        if (!exec(kSchemaV1, errorOut)) {
            LOG_ERROR(stStore, "Failed to create schema");
            return false;
        }
    }

    if (!inMemory) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(stStore, "Database opened: %s (schema v%d)", qUtf8Printable(dbPath),
             kCurrentSchemaVersion);
    return true;
}

} // namespace st

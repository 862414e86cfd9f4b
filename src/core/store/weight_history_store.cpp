#include "core/store/weight_history_store.h"
#include "core/shared/logging.h"
#include "core/store/sqlite_database.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

#include <sqlite3.h>

namespace st {

namespace {

constexpr const char* kActiveVersionKey = "active_version";

bool prepare(sqlite3* db, const char* sql, sqlite3_stmt** stmt, Error* errorOut)
{
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(stStore, "prepare failed: %s", sqlite3_errmsg(db));
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(db)));
    }
    return true;
}

bool writeActiveVersion(sqlite3* db, uint64_t version, Error* errorOut)
{
    static constexpr const char* kSql = R"(
        INSERT INTO weight_state (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(db, kSql, &stmt, errorOut)) {
        return false;
    }
    const QByteArray value = QByteArray::number(static_cast<qulonglong>(version));
    sqlite3_bind_text(stmt, 1, kActiveVersionKey, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, value.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(db)));
    }
    return true;
}

} // namespace

WeightHistoryStore::WeightHistoryStore(sqlite3* db)
    : m_db(db)
{
}

bool WeightHistoryStore::append(const WeightVector& weights,
                                std::optional<double> validationLoss,
                                bool makeActive,
                                Error* errorOut)
{
    if (!m_db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
    }

    static constexpr const char* kSql = R"(
        INSERT INTO weight_versions (
            version,
            created_at_ms,
            schema_version,
            source,
            validation_loss,
            weights_json
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    if (!execSql(m_db, "BEGIN IMMEDIATE", errorOut)) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, kSql, &stmt, errorOut)) {
        execSql(m_db, "ROLLBACK");
        return false;
    }

    const QByteArray sourceUtf8 = weights.source().toUtf8();
    const QByteArray weightsUtf8 =
        QJsonDocument(weights.weightsToJson()).toJson(QJsonDocument::Compact);

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(weights.version()));
    sqlite3_bind_int64(stmt, 2, weights.createdAt().toMSecsSinceEpoch());
    sqlite3_bind_int(stmt, 3, weights.schemaVersion());
    sqlite3_bind_text(stmt, 4, sourceUtf8.constData(), -1, SQLITE_STATIC);
    if (validationLoss) {
        sqlite3_bind_double(stmt, 5, *validationLoss);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_text(stmt, 6, weightsUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        execSql(m_db, "ROLLBACK");
        LOG_ERROR(stStore, "Failed to persist weights v%llu: %s",
                  static_cast<unsigned long long>(weights.version()), qUtf8Printable(message));
        return fail(errorOut, ErrorKind::Persistence, message);
    }

    if (makeActive && !writeActiveVersion(m_db, weights.version(), errorOut)) {
        execSql(m_db, "ROLLBACK");
        return false;
    }

    if (!execSql(m_db, "COMMIT", errorOut)) {
        execSql(m_db, "ROLLBACK");
        return false;
    }
    return true;
}

bool WeightHistoryStore::setActiveVersion(uint64_t version, Error* errorOut)
{
    if (!m_db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
    }
    return writeActiveVersion(m_db, version, errorOut);
}

std::optional<uint64_t> WeightHistoryStore::activeVersion(Error* errorOut) const
{
    if (!m_db) {
        fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, "SELECT value FROM weight_state WHERE key = ?1", &stmt, errorOut)) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, kActiveVersionKey, -1, SQLITE_STATIC);

    std::optional<uint64_t> version;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        bool ok = false;
        const qulonglong parsed = QByteArray(text ? text : "").toULongLong(&ok);
        if (ok) {
            version = static_cast<uint64_t>(parsed);
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool WeightHistoryStore::loadAll(std::vector<Record>* out, int* skippedOut, Error* errorOut) const
{
    if (!out) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("no output vector"));
    }
    out->clear();
    if (skippedOut) {
        *skippedOut = 0;
    }
    if (!m_db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
    }

    static constexpr const char* kSql = R"(
        SELECT version, created_at_ms, source, validation_loss, weights_json
        FROM weight_versions
        ORDER BY version ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, kSql, &stmt, errorOut)) {
        return false;
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const uint64_t version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        const QDateTime createdAt = QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 1)).toUTC();
        const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        const char* json = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(QByteArray(json ? json : ""), &parseError);
        Error decodeError;
        std::optional<WeightVector> weights;
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            weights = WeightVector::fromWeightsJson(doc.object(), version, createdAt,
                                                    QString::fromUtf8(source ? source : ""),
                                                    &decodeError);
        }
        if (!weights) {
            LOG_WARN(stStore, "Skipping stored weights v%llu: %s",
                     static_cast<unsigned long long>(version), qUtf8Printable(decodeError.message));
            if (skippedOut) {
                ++*skippedOut;
            }
            continue;
        }

        Record record{*weights, std::nullopt};
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            record.validationLoss = sqlite3_column_double(stmt, 3);
        }
        out->push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        out->clear();
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    return true;
}

std::optional<uint64_t> WeightHistoryStore::maxVersion(Error* errorOut) const
{
    if (!m_db) {
        fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, "SELECT COALESCE(MAX(version), 0) FROM weight_versions", &stmt, errorOut)) {
        return std::nullopt;
    }

    std::optional<uint64_t> version;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    } else {
        fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    sqlite3_finalize(stmt);
    return version;
}

int WeightHistoryStore::deleteOlderThan(const QDateTime& cutoff,
                                        const std::vector<uint64_t>& keep,
                                        Error* errorOut)
{
    if (!m_db) {
        fail(errorOut, ErrorKind::Persistence, QStringLiteral("history store has no database"));
        return -1;
    }

    sqlite3_stmt* select = nullptr;
    if (!prepare(m_db, "SELECT version FROM weight_versions WHERE created_at_ms < ?1", &select,
                 errorOut)) {
        return -1;
    }
    sqlite3_bind_int64(select, 1, cutoff.toMSecsSinceEpoch());
    std::vector<uint64_t> doomed;
    while (sqlite3_step(select) == SQLITE_ROW) {
        const uint64_t version = static_cast<uint64_t>(sqlite3_column_int64(select, 0));
        if (std::find(keep.begin(), keep.end(), version) == keep.end()) {
            doomed.push_back(version);
        }
    }
    sqlite3_finalize(select);

    if (doomed.empty()) {
        return 0;
    }

    if (!execSql(m_db, "BEGIN IMMEDIATE", errorOut)) {
        return -1;
    }
    sqlite3_stmt* del = nullptr;
    if (!prepare(m_db, "DELETE FROM weight_versions WHERE version = ?1", &del, errorOut)) {
        execSql(m_db, "ROLLBACK");
        return -1;
    }
    for (uint64_t version : doomed) {
        sqlite3_reset(del);
        sqlite3_bind_int64(del, 1, static_cast<sqlite3_int64>(version));
        if (sqlite3_step(del) != SQLITE_DONE) {
            const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
            sqlite3_finalize(del);
            execSql(m_db, "ROLLBACK");
            fail(errorOut, ErrorKind::Persistence, message);
            return -1;
        }
    }
    sqlite3_finalize(del);

    if (!execSql(m_db, "COMMIT", errorOut)) {
        execSql(m_db, "ROLLBACK");
        return -1;
    }
    return static_cast<int>(doomed.size());
}

} // namespace st

#include "core/learning/example_log.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <sqlite3.h>

namespace st {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

} // namespace

SqliteExampleLog::SqliteExampleLog(sqlite3* db)
    : m_db(db)
{
}

bool SqliteExampleLog::appendExample(const TrainingExample& example, Error* errorOut)
{
    if (!m_db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("example log has no database"));
    }

    static constexpr const char* kSql = R"(
        INSERT INTO impressions_v1 (
            session_id,
            trip_id,
            position,
            clicked,
            dwell_seconds,
            converted,
            bot_flagged,
            schema_version,
            features_json,
            created_at_ms
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(stStore, "appendExample prepare failed: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }

    const QByteArray sessionUtf8 = example.sessionId.toUtf8();
    const QByteArray featuresUtf8 =
        QJsonDocument(featureVectorToJson(example.features)).toJson(QJsonDocument::Compact);

    sqlite3_bind_text(stmt, 1, sessionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, example.tripId);
    sqlite3_bind_int(stmt, 3, example.position);
    sqlite3_bind_int(stmt, 4, example.clicked ? 1 : 0);
    if (example.dwellSeconds) {
        sqlite3_bind_double(stmt, 5, *example.dwellSeconds);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    if (example.converted) {
        sqlite3_bind_int(stmt, 6, *example.converted ? 1 : 0);
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_int(stmt, 7, example.botFlagged ? 1 : 0);
    sqlite3_bind_int(stmt, 8, example.features.schemaVersion);
    sqlite3_bind_text(stmt, 9, featuresUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 10, example.timestamp.isValid()
                                     ? example.timestamp.toMSecsSinceEpoch()
                                     : 0);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(stStore, "appendExample step failed: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }
    return true;
}

bool SqliteExampleLog::fetchWindow(const QDateTime& from,
                                   const QDateTime& to,
                                   ExampleWindow* out,
                                   Error* errorOut)
{
    if (!out) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("no output window"));
    }
    out->examples.clear();
    out->malformedRows = 0;

    if (!m_db) {
        return fail(errorOut, ErrorKind::Persistence, QStringLiteral("example log has no database"));
    }

    static constexpr const char* kSql = R"(
        SELECT session_id, trip_id, position, clicked, dwell_seconds, converted,
               bot_flagged, schema_version, features_json, created_at_ms
        FROM impressions_v1
        WHERE created_at_ms >= ?1 AND created_at_ms < ?2
        ORDER BY created_at_ms ASC, id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(stStore, "fetchWindow prepare failed: %s", sqlite3_errmsg(m_db));
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }

    sqlite3_bind_int64(stmt, 1, from.toMSecsSinceEpoch());
    sqlite3_bind_int64(stmt, 2, to.toMSecsSinceEpoch());

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TrainingExample example;
        example.sessionId = columnText(stmt, 0);
        example.tripId = sqlite3_column_int64(stmt, 1);
        example.position = sqlite3_column_int(stmt, 2);
        example.clicked = sqlite3_column_int(stmt, 3) != 0;
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            example.dwellSeconds = sqlite3_column_double(stmt, 4);
        }
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            example.converted = sqlite3_column_int(stmt, 5) != 0;
        }
        example.botFlagged = sqlite3_column_int(stmt, 6) != 0;
        const int schemaVersion = sqlite3_column_int(stmt, 7);
        example.timestamp = QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 9)).toUTC();

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(columnText(stmt, 8).toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            ++out->malformedRows;
            continue;
        }
        auto features = featureVectorFromJson(doc.object(), schemaVersion);
        if (!features) {
            ++out->malformedRows;
            continue;
        }
        example.features = *features;
        out->examples.push_back(std::move(example));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(stStore, "fetchWindow step failed: %s", sqlite3_errmsg(m_db));
        out->examples.clear();
        return fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
    }

    LOG_DEBUG(stLearning, "Fetched %d examples (%d malformed)",
              static_cast<int>(out->examples.size()), out->malformedRows);
    return true;
}

int SqliteExampleLog::count() const
{
    if (!m_db) {
        return 0;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM impressions_v1", -1, &stmt, nullptr)
        != SQLITE_OK) {
        LOG_WARN(stStore, "count prepare failed: %s", sqlite3_errmsg(m_db));
        return 0;
    }
    int total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return total;
}

int SqliteExampleLog::purgeBefore(const QDateTime& cutoff, Error* errorOut)
{
    if (!m_db) {
        fail(errorOut, ErrorKind::Persistence, QStringLiteral("example log has no database"));
        return -1;
    }

    static constexpr const char* kSql = "DELETE FROM impressions_v1 WHERE created_at_ms < ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, cutoff.toMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail(errorOut, ErrorKind::Persistence, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return -1;
    }
    const int removed = sqlite3_changes(m_db);
    LOG_DEBUG(stStore, "Purged %d impressions", removed);
    return removed;
}

} // namespace st

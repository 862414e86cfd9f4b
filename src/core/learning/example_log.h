#pragma once

#include "core/learning/training_types.h"
#include "core/shared/errors.h"

#include <QDateTime>

struct sqlite3;

namespace st {

struct ExampleWindow {
    TrainingBatch examples;
    int malformedRows = 0;  // rows whose stored features could not be decoded
};

// Read side of the logging collaborator.
class TrainingExampleSource {
public:
    virtual ~TrainingExampleSource() = default;

    // Examples with from <= timestamp < to, oldest first.
    virtual bool fetchWindow(const QDateTime& from,
                             const QDateTime& to,
                             ExampleWindow* out,
                             Error* errorOut = nullptr) = 0;
};

// TrainingExampleSource over the impressions_v1 table.
class SqliteExampleLog : public TrainingExampleSource {
public:
    explicit SqliteExampleLog(sqlite3* db);

    bool fetchWindow(const QDateTime& from,
                     const QDateTime& to,
                     ExampleWindow* out,
                     Error* errorOut = nullptr) override;

    // Writer used by the logging collaborator and by fixtures.
    bool appendExample(const TrainingExample& example, Error* errorOut = nullptr);

    int count() const;

    // Drops rows older than cutoff; returns the number removed or -1.
    int purgeBefore(const QDateTime& cutoff, Error* errorOut = nullptr);

private:
    sqlite3* m_db = nullptr;
};

} // namespace st

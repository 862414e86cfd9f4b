#pragma once

#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"

#include <QDateTime>

#include <cstdint>
#include <optional>
#include <vector>

struct sqlite3;

namespace st {

// SQLite persistence for the weight history and the active pointer.
class WeightHistoryStore {
public:
    struct Record {
        WeightVector weights;
        std::optional<double> validationLoss;
    };

    explicit WeightHistoryStore(sqlite3* db);

    // Inserts the version and, when makeActive, moves the active pointer to
    // it in the same transaction.
    bool append(const WeightVector& weights,
                std::optional<double> validationLoss,
                bool makeActive,
                Error* errorOut = nullptr);

    bool setActiveVersion(uint64_t version, Error* errorOut = nullptr);
    std::optional<uint64_t> activeVersion(Error* errorOut = nullptr) const;

    // All stored versions, ascending. Rows that no longer decode under the
    // current schema are skipped and counted in skippedOut.
    bool loadAll(std::vector<Record>* out, int* skippedOut = nullptr, Error* errorOut = nullptr) const;

    // Highest version ever stored, including rows loadAll() skips. 0 when
    // the table is empty.
    std::optional<uint64_t> maxVersion(Error* errorOut = nullptr) const;

    // Deletes versions created before cutoff except the listed ones.
    // Returns the number removed or -1.
    int deleteOlderThan(const QDateTime& cutoff,
                        const std::vector<uint64_t>& keep,
                        Error* errorOut = nullptr);

private:
    sqlite3* m_db = nullptr;
};

} // namespace st

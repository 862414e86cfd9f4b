#pragma once

#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"

#include <QDateTime>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace st {

class WeightHistoryStore;

// Single source of truth for the live weights. Readers take a snapshot with
// getActive() (an atomic shared_ptr load, never blocks on writers); writers
// are serialized and persist before swapping the pointer.
class WeightStore {
public:
    using Snapshot = std::shared_ptr<const WeightVector>;

    // Starts with the default weights as version 1. With a history store,
    // initialize() replaces that with the persisted state.
    explicit WeightStore(WeightHistoryStore* persistence = nullptr);

    bool initialize(Error* errorOut = nullptr);

    Snapshot getActive() const;
    uint64_t activeVersion() const { return getActive()->version(); }
    uint64_t latestVersion() const;

    // Publishes the candidate's weights under the next version number and
    // makes it active. The candidate's own version and timestamp are ignored.
    std::optional<uint64_t> publish(const WeightVector& candidate,
                                    std::optional<double> validationLoss = std::nullopt,
                                    const QDateTime& createdAt = QDateTime::currentDateTimeUtc(),
                                    Error* errorOut = nullptr);

    // Publishes only while expectedActive is still the active version;
    // otherwise fails with StaleCandidate and leaves the store untouched.
    std::optional<uint64_t> publishIfActive(uint64_t expectedActive,
                                            const WeightVector& candidate,
                                            std::optional<double> validationLoss = std::nullopt,
                                            const QDateTime& createdAt = QDateTime::currentDateTimeUtc(),
                                            Error* errorOut = nullptr);

    // Re-activates a historical version. No new version is minted.
    bool rollback(uint64_t version, Error* errorOut = nullptr);

    // Most recent first.
    std::vector<Snapshot> history(std::size_t limit) const;
    Snapshot find(uint64_t version) const;

    // Removes versions older than retentionDays, never the active one and
    // never the newest. Returns the number removed or -1.
    int pruneHistory(const QDateTime& now, int retentionDays, Error* errorOut = nullptr);

private:
    void swapActive(Snapshot next);
    bool checkCandidate(const WeightVector& candidate, Error* errorOut) const;
    std::optional<uint64_t> publishLocked(const WeightVector& candidate,
                                          std::optional<double> validationLoss,
                                          const QDateTime& createdAt,
                                          Error* errorOut);

    WeightHistoryStore* m_persistence = nullptr;
    Snapshot m_active;                // accessed only via std::atomic_load/store
    mutable std::mutex m_writeMutex;  // guards m_history and writers
    std::vector<Snapshot> m_history;  // ascending by version
    uint64_t m_latestVersion = 0;     // highest version ever issued, loaded or not
};

} // namespace st

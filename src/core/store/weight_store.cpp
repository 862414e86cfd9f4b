#include "core/store/weight_store.h"
#include "core/shared/logging.h"
#include "core/store/weight_history_store.h"

#include <algorithm>

namespace st {

WeightStore::WeightStore(WeightHistoryStore* persistence)
    : m_persistence(persistence)
{
    auto seed = std::make_shared<const WeightVector>(WeightVector::defaults());
    m_history.push_back(seed);
    m_latestVersion = seed->version();
    std::atomic_store(&m_active, Snapshot(seed));
}

bool WeightStore::initialize(Error* errorOut)
{
    if (!m_persistence) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    std::vector<WeightHistoryStore::Record> records;
    int skipped = 0;
    if (!m_persistence->loadAll(&records, &skipped, errorOut)) {
        return false;
    }

    const std::optional<uint64_t> storedMax = m_persistence->maxVersion(errorOut);
    if (!storedMax) {
        return false;
    }

    if (records.empty()) {
        // Rows written under another feature schema keep their version
        // numbers; the fresh defaults go after them.
        const Snapshot defaults = m_history.front();
        const Snapshot seed = *storedMax == 0
            ? defaults
            : std::make_shared<const WeightVector>(
                  defaults->withVersion(*storedMax + 1, defaults->createdAt()));
        if (!m_persistence->append(*seed, std::nullopt, /*makeActive=*/true, errorOut)) {
            return false;
        }
        m_history = {seed};
        m_latestVersion = seed->version();
        swapActive(seed);
        LOG_INFO(stStore, "Seeded weight history with defaults as v%llu (%d stored rows skipped)",
                 static_cast<unsigned long long>(seed->version()), skipped);
        return true;
    }

    std::vector<Snapshot> loaded;
    loaded.reserve(records.size());
    for (auto& record : records) {
        loaded.push_back(std::make_shared<const WeightVector>(std::move(record.weights)));
    }

    Snapshot active = loaded.back();
    const std::optional<uint64_t> activeVersion = m_persistence->activeVersion(errorOut);
    if (activeVersion) {
        auto it = std::find_if(loaded.begin(), loaded.end(), [&](const Snapshot& snapshot) {
            return snapshot->version() == *activeVersion;
        });
        if (it != loaded.end()) {
            active = *it;
        } else {
            LOG_WARN(stStore, "Stored active version v%llu not in history, using newest",
                     static_cast<unsigned long long>(*activeVersion));
        }
    }

    m_history = std::move(loaded);
    m_latestVersion = std::max(*storedMax, m_history.back()->version());
    swapActive(active);
    LOG_INFO(stStore, "Loaded %d weight versions (%d skipped), active v%llu",
             static_cast<int>(m_history.size()), skipped,
             static_cast<unsigned long long>(active->version()));
    return true;
}

WeightStore::Snapshot WeightStore::getActive() const
{
    return std::atomic_load(&m_active);
}

uint64_t WeightStore::latestVersion() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_latestVersion;
}

void WeightStore::swapActive(Snapshot next)
{
    std::atomic_store(&m_active, std::move(next));
}

bool WeightStore::checkCandidate(const WeightVector& candidate, Error* errorOut) const
{
    if (candidate.schemaVersion() != kFeatureSchemaVersion) {
        return fail(errorOut, ErrorKind::SchemaMismatch,
                    QStringLiteral("candidate schema %1, expected %2")
                        .arg(candidate.schemaVersion())
                        .arg(kFeatureSchemaVersion));
    }
    if (!candidate.allFinite()) {
        return fail(errorOut, ErrorKind::Divergence, QStringLiteral("candidate has non-finite weights"));
    }
    return true;
}

std::optional<uint64_t> WeightStore::publish(const WeightVector& candidate,
                                             std::optional<double> validationLoss,
                                             const QDateTime& createdAt,
                                             Error* errorOut)
{
    if (!checkCandidate(candidate, errorOut)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return publishLocked(candidate, validationLoss, createdAt, errorOut);
}

std::optional<uint64_t> WeightStore::publishIfActive(uint64_t expectedActive,
                                                     const WeightVector& candidate,
                                                     std::optional<double> validationLoss,
                                                     const QDateTime& createdAt,
                                                     Error* errorOut)
{
    if (!checkCandidate(candidate, errorOut)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_writeMutex);

    const uint64_t current = getActive()->version();
    if (current != expectedActive) {
        LOG_WARN(stStore, "Candidate based on v%llu not published, active is now v%llu",
                 static_cast<unsigned long long>(expectedActive),
                 static_cast<unsigned long long>(current));
        fail(errorOut, ErrorKind::StaleCandidate,
             QStringLiteral("candidate based on v%1, active is v%2").arg(expectedActive).arg(current));
        return std::nullopt;
    }
    return publishLocked(candidate, validationLoss, createdAt, errorOut);
}

std::optional<uint64_t> WeightStore::publishLocked(const WeightVector& candidate,
                                                   std::optional<double> validationLoss,
                                                   const QDateTime& createdAt,
                                                   Error* errorOut)
{
    const uint64_t nextVersion = m_latestVersion + 1;
    auto published = std::make_shared<const WeightVector>(candidate.withVersion(nextVersion, createdAt));

    if (m_persistence
        && !m_persistence->append(*published, validationLoss, /*makeActive=*/true, errorOut)) {
        LOG_ERROR(stStore, "Publish of v%llu failed, active stays v%llu",
                  static_cast<unsigned long long>(nextVersion),
                  static_cast<unsigned long long>(getActive()->version()));
        return std::nullopt;
    }

    m_history.push_back(published);
    m_latestVersion = nextVersion;
    swapActive(published);
    LOG_INFO(stStore, "Published weights v%llu (%s)",
             static_cast<unsigned long long>(nextVersion), qUtf8Printable(published->source()));
    return nextVersion;
}

bool WeightStore::rollback(uint64_t version, Error* errorOut)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    auto it = std::find_if(m_history.begin(), m_history.end(), [version](const Snapshot& snapshot) {
        return snapshot->version() == version;
    });
    if (it == m_history.end()) {
        return fail(errorOut, ErrorKind::UnknownVersion,
                    QStringLiteral("no weight version %1 in history").arg(version));
    }

    if (m_persistence && !m_persistence->setActiveVersion(version, errorOut)) {
        return false;
    }

    const uint64_t previous = getActive()->version();
    swapActive(*it);
    LOG_INFO(stStore, "Rolled back weights v%llu -> v%llu",
             static_cast<unsigned long long>(previous), static_cast<unsigned long long>(version));
    return true;
}

std::vector<WeightStore::Snapshot> WeightStore::history(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    std::vector<Snapshot> out;
    const std::size_t count = std::min(limit, m_history.size());
    out.reserve(count);
    for (auto it = m_history.rbegin(); it != m_history.rend() && out.size() < count; ++it) {
        out.push_back(*it);
    }
    return out;
}

WeightStore::Snapshot WeightStore::find(uint64_t version) const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    for (const Snapshot& snapshot : m_history) {
        if (snapshot->version() == version) {
            return snapshot;
        }
    }
    return nullptr;
}

int WeightStore::pruneHistory(const QDateTime& now, int retentionDays, Error* errorOut)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_history.empty()) {
        return 0;
    }

    const QDateTime cutoff = now.addDays(-retentionDays);
    const uint64_t active = getActive()->version();
    const uint64_t newest = m_history.back()->version();

    if (m_persistence
        && m_persistence->deleteOlderThan(cutoff, {active, newest, m_latestVersion}, errorOut) < 0) {
        return -1;
    }

    const auto before = m_history.size();
    m_history.erase(std::remove_if(m_history.begin(), m_history.end(),
                                   [&](const Snapshot& snapshot) {
                                       return snapshot->createdAt() < cutoff
                                           && snapshot->version() != active
                                           && snapshot->version() != newest;
                                   }),
                    m_history.end());
    const int removed = static_cast<int>(before - m_history.size());
    if (removed > 0) {
        LOG_INFO(stStore, "Pruned %d weight versions older than %s", removed,
                 qUtf8Printable(cutoff.toString(Qt::ISODate)));
    }
    return removed;
}

} // namespace st

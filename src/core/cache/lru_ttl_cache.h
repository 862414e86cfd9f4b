#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace st {

struct LruTtlCacheConfig {
    int maxEntries = 128;
    int ttlSeconds = 30;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    uint64_t fallthroughs = 0;  // lookups served while the cache was down
    int currentSize = 0;
};

// Thread-safe LRU cache with a single TTL class. An entry is never returned
// once its age reaches ttlSeconds; expired entries are removed lazily.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruTtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit LruTtlCache(LruTtlCacheConfig config = {}, ClockFn clock = ClockFn())
        : m_config(config)
        , m_clock(clock ? std::move(clock) : ClockFn([]() { return Clock::now(); }))
    {
    }

    std::optional<Value> get(const Key& key)
    {
        return getIf(key, [](const Value&) { return true; });
    }

    // Like get(), but an entry rejected by isCurrent counts as a miss and is
    // dropped.
    template <typename Pred>
    std::optional<Value> getIf(const Key& key, Pred isCurrent)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_index.find(key);
        if (it == m_index.end()) {
            ++m_misses;
            return std::nullopt;
        }

        if (isExpired(*it->second)) {
            m_list.erase(it->second);
            m_index.erase(it);
            ++m_expirations;
            ++m_misses;
            return std::nullopt;
        }

        if (!isCurrent(it->second->value)) {
            m_list.erase(it->second);
            m_index.erase(it);
            ++m_misses;
            return std::nullopt;
        }

        // Move to front (most recently used)
        if (it->second != m_list.begin()) {
            m_list.splice(m_list.begin(), m_list, it->second);
        }

        ++m_hits;
        return it->second->value;
    }

    void put(const Key& key, Value value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto existing = m_index.find(key);
        if (existing != m_index.end()) {
            m_list.erase(existing->second);
            m_index.erase(existing);
        }

        while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
            m_index.erase(m_list.back().key);
            m_list.pop_back();
            ++m_evictions;
        }

        m_list.push_front({key, std::move(value), m_clock()});
        m_index[key] = m_list.begin();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_list.clear();
        m_index.clear();
    }

    void recordFallthrough()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_fallthroughs;
    }

    CacheStats stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        CacheStats s;
        s.hits = m_hits;
        s.misses = m_misses;
        s.evictions = m_evictions;
        s.expirations = m_expirations;
        s.fallthroughs = m_fallthroughs;
        s.currentSize = static_cast<int>(m_list.size());
        return s;
    }

    const LruTtlCacheConfig& config() const { return m_config; }

private:
    struct Entry {
        Key key;
        Value value;
        Clock::time_point insertedAt;
    };

    bool isExpired(const Entry& entry) const
    {
        const auto age = m_clock() - entry.insertedAt;
        return age >= std::chrono::seconds(m_config.ttlSeconds);
    }

    LruTtlCacheConfig m_config;
    ClockFn m_clock;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
    uint64_t m_expirations = 0;
    uint64_t m_fallthroughs = 0;
};

} // namespace st

#pragma once

#include "core/ranking/scored_trip.h"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace st {

// Bounded heap holding the best k ScoredTrips seen so far. The heap top is
// the current worst entry, so a full heap is compared against it in O(1)
// and replaced in O(log k).
class TopKHeap {
public:
    explicit TopKHeap(std::size_t k)
        : m_k(k)
    {
        m_items.reserve(k);
    }

    std::size_t capacity() const { return m_k; }
    std::size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }
    bool full() const { return m_items.size() >= m_k; }

    // Only valid when !empty().
    const ScoredTrip& worst() const { return m_items.front(); }

    // True when an entry with this score and id would enter the heap.
    bool accepts(double score, int64_t tripId) const
    {
        if (m_k == 0) {
            return false;
        }
        if (!full()) {
            return true;
        }
        return ranksBefore(score, tripId, worst().score, worst().trip.tripId);
    }

    // True when a score upper bound proves the candidate cannot enter.
    bool rejectsBound(double upperBound) const
    {
        return full() && m_k > 0 && upperBound < worst().score;
    }

    bool offer(ScoredTrip item)
    {
        if (!accepts(item.score, item.trip.tripId)) {
            return false;
        }
        if (full()) {
            std::pop_heap(m_items.begin(), m_items.end(), &TopKHeap::heapLess);
            m_items.back() = std::move(item);
        } else {
            m_items.push_back(std::move(item));
        }
        std::push_heap(m_items.begin(), m_items.end(), &TopKHeap::heapLess);
        return true;
    }

    // Best first. Leaves the heap empty.
    std::vector<ScoredTrip> takeSorted()
    {
        std::vector<ScoredTrip> out = std::move(m_items);
        m_items.clear();
        std::sort(out.begin(), out.end(),
                  [](const ScoredTrip& a, const ScoredTrip& b) { return ranksBefore(a, b); });
        return out;
    }

private:
    // Max-heap under "ranks before" keeps the worst entry on top.
    static bool heapLess(const ScoredTrip& a, const ScoredTrip& b) { return ranksBefore(a, b); }

    std::size_t m_k = 0;
    std::vector<ScoredTrip> m_items;
};

} // namespace st

#pragma once

#include "core/ranking/feature_schema.h"
#include "core/shared/trip_candidate.h"

#include <QJsonObject>

#include <cstdint>

namespace st {

struct ScoredTrip {
    TripCandidate trip;
    FeatureVector features;
    double score = 0.0;
    uint64_t weightVersion = 0;
    FeatureArray contributions{};  // weight * value per FeatureKey
    bool relaxed = false;          // came from the relaxed inventory pass
    double penalty = 0.0;          // already included in score

    // {"tripId", "score", "weightVersion", "trip", "features", "contributions",
    //  "relaxed", "penalty"}
    QJsonObject toJson() const;
};

// Result order: score descending, then trip id ascending.
inline bool ranksBefore(double scoreA, int64_t idA, double scoreB, int64_t idB)
{
    if (scoreA != scoreB) {
        return scoreA > scoreB;
    }
    return idA < idB;
}

inline bool ranksBefore(const ScoredTrip& a, const ScoredTrip& b)
{
    return ranksBefore(a.score, a.trip.tripId, b.score, b.trip.tripId);
}

} // namespace st

#pragma once

#include "core/ranking/feature_schema.h"
#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"
#include "core/shared/search_preferences.h"
#include "core/shared/settings.h"
#include "core/shared/trip_candidate.h"

#include <QDate>

#include <optional>

namespace st {

// Encodes how well a trip matches the preferences as a fixed-schema
// FeatureVector. Pure and deterministic for a given reference date.
class FeatureExtractor {
public:
    explicit FeatureExtractor(ExtractionSettings settings = {},
                              int schemaVersion = kFeatureSchemaVersion);

    int schemaVersion() const { return m_schemaVersion; }
    const ExtractionSettings& settings() const { return m_settings; }

    // Fails with SchemaMismatch when targetSchemaVersion (the schema of the
    // weights the vector will be scored against) differs from ours.
    std::optional<FeatureVector> extract(const TripCandidate& trip,
                                         const SearchPreferences& prefs,
                                         const QDate& referenceDate,
                                         int targetSchemaVersion,
                                         Error* errorOut = nullptr) const;

    // Upper bound on dot(extract(...), weights) using only fields that are
    // trivially available; bounded levels contribute their best case.
    double scoreUpperBound(const TripCandidate& trip,
                           const SearchPreferences& prefs,
                           const QDate& referenceDate,
                           const WeightVector& weights) const;

private:
    double themeMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs, int* matchesOut) const;
    double difficultyMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs) const;
    double durationMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs) const;
    double budgetMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs) const;
    double departingSoon(const TripCandidate& trip, const QDate& referenceDate) const;
    static double statusLevel(TripStatus status);
    static double geoMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs);

    ExtractionSettings m_settings;
    int m_schemaVersion = kFeatureSchemaVersion;
};

} // namespace st

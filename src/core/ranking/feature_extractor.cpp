#include "core/ranking/feature_extractor.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace st {

FeatureExtractor::FeatureExtractor(ExtractionSettings settings, int schemaVersion)
    : m_settings(settings)
    , m_schemaVersion(schemaVersion)
{
}

double FeatureExtractor::themeMatchLevel(const TripCandidate& trip,
                                         const SearchPreferences& prefs,
                                         int* matchesOut) const
{
    int matches = 0;
    for (int themeId : trip.themeTagIds) {
        if (std::binary_search(prefs.themeIds.begin(), prefs.themeIds.end(), themeId)) {
            ++matches;
        }
    }
    if (matchesOut) {
        *matchesOut = matches;
    }

    if (matches >= std::max(1, m_settings.themeFullMatchThreshold)) {
        return 2.0;
    }
    return matches > 0 ? 1.0 : 0.0;
}

double FeatureExtractor::difficultyMatchLevel(const TripCandidate& trip,
                                              const SearchPreferences& prefs) const
{
    if (!prefs.difficulty) {
        return 0.0;
    }
    const int delta = std::abs(trip.difficultyLevel - *prefs.difficulty);
    if (delta == 0) {
        return 2.0;
    }
    return delta <= m_settings.difficultyTolerance ? 1.0 : 0.0;
}

double FeatureExtractor::durationMatchLevel(const TripCandidate& trip,
                                            const SearchPreferences& prefs) const
{
    if (!prefs.minDurationDays && !prefs.maxDurationDays) {
        return 0.0;
    }
    if (trip.privateGroup) {
        return 2.0;
    }

    const int lo = prefs.minDurationDays.value_or(0);
    const int hi = prefs.maxDurationDays.value_or(std::numeric_limits<int>::max());
    if (trip.durationDays >= lo && trip.durationDays <= hi) {
        return 2.0;
    }

    const int distance = trip.durationDays < lo ? lo - trip.durationDays : trip.durationDays - hi;
    return distance <= m_settings.durationGoodDays ? 1.0 : 0.0;
}

double FeatureExtractor::budgetMatchLevel(const TripCandidate& trip,
                                          const SearchPreferences& prefs) const
{
    if (!prefs.budget) {
        return 0.0;
    }
    const double budget = *prefs.budget;
    if (trip.price <= budget) {
        return 3.0;
    }
    if (trip.price <= budget * m_settings.budgetGoodRatio) {
        return 2.0;
    }
    if (trip.price <= budget * m_settings.budgetAcceptableRatio) {
        return 1.0;
    }
    return 0.0;
}

double FeatureExtractor::departingSoon(const TripCandidate& trip, const QDate& referenceDate) const
{
    if (trip.privateGroup || !trip.departureDate.isValid() || !referenceDate.isValid()) {
        return 0.0;
    }
    const qint64 days = referenceDate.daysTo(trip.departureDate);
    return (days >= 0 && days <= m_settings.departingSoonDays) ? 1.0 : 0.0;
}

double FeatureExtractor::statusLevel(TripStatus status)
{
    switch (status) {
    case TripStatus::Available:  return 0.0;
    case TripStatus::Guaranteed: return 1.0;
    case TripStatus::LastPlaces: return 2.0;
    case TripStatus::Full:
    case TripStatus::Cancelled:  return 0.0;
    }
    return 0.0;
}

double FeatureExtractor::geoMatchLevel(const TripCandidate& trip, const SearchPreferences& prefs)
{
    if (prefs.countryIds.empty() && prefs.continents.empty()) {
        return 0.0;
    }

    const bool continentSelected = std::binary_search(
        prefs.continents.begin(), prefs.continents.end(), trip.continent);

    // Antarctica is both a continent and its own destination.
    const bool antarctica = continentSelected
        && trip.continent == Continent::Antarctica
        && trip.countryName.compare(QLatin1String("Antarctica"), Qt::CaseInsensitive) == 0;

    if (antarctica
        || std::binary_search(prefs.countryIds.begin(), prefs.countryIds.end(), trip.countryId)) {
        return 2.0;
    }
    return continentSelected ? 1.0 : 0.0;
}

std::optional<FeatureVector> FeatureExtractor::extract(const TripCandidate& trip,
                                                       const SearchPreferences& prefs,
                                                       const QDate& referenceDate,
                                                       int targetSchemaVersion,
                                                       Error* errorOut) const
{
    if (targetSchemaVersion != m_schemaVersion) {
        LOG_WARN(stRanking, "Extractor schema %d does not match weight schema %d",
                 m_schemaVersion, targetSchemaVersion);
        fail(errorOut, ErrorKind::SchemaMismatch,
             QStringLiteral("extractor schema %1, weight schema %2")
                 .arg(m_schemaVersion)
                 .arg(targetSchemaVersion));
        return std::nullopt;
    }

    FeatureVector features;
    features.schemaVersion = m_schemaVersion;
    features.set(FeatureKey::BaseScore, 1.0);

    if (!prefs.themeIds.empty()) {
        int matches = 0;
        features.set(FeatureKey::ThemeMatchLevel, themeMatchLevel(trip, prefs, &matches));
        features.set(FeatureKey::ThemeMiss, matches == 0 ? 1.0 : 0.0);
    }

    features.set(FeatureKey::DifficultyMatchLevel, difficultyMatchLevel(trip, prefs));
    features.set(FeatureKey::DurationMatchLevel, durationMatchLevel(trip, prefs));
    features.set(FeatureKey::BudgetMatchLevel, budgetMatchLevel(trip, prefs));
    features.set(FeatureKey::StatusLevel, statusLevel(trip.status));
    features.set(FeatureKey::DepartingSoon, departingSoon(trip, referenceDate));
    features.set(FeatureKey::GeoMatchLevel, geoMatchLevel(trip, prefs));
    return features;
}

double FeatureExtractor::scoreUpperBound(const TripCandidate& trip,
                                         const SearchPreferences& prefs,
                                         const QDate& referenceDate,
                                         const WeightVector& weights) const
{
    // Per-key terms are at least the matching score terms, and summing them
    // in ScoringEngine::score order keeps the rounded total at least the
    // rounded score.
    FeatureArray terms{};
    const auto exact = [&](FeatureKey key, double value) {
        terms[featureIndex(key)] = value * weights.weight(key);
    };
    const auto best = [&](FeatureKey key) {
        const FeatureRange range = featureRange(key);
        const double w = weights.weight(key);
        terms[featureIndex(key)] = std::max(range.lo * w, range.hi * w);
    };

    exact(FeatureKey::BaseScore, 1.0);
    if (!prefs.themeIds.empty()) {
        best(FeatureKey::ThemeMatchLevel);
        best(FeatureKey::ThemeMiss);
    }
    if (prefs.difficulty) {
        best(FeatureKey::DifficultyMatchLevel);
    }
    if (prefs.minDurationDays || prefs.maxDurationDays) {
        best(FeatureKey::DurationMatchLevel);
    }
    if (prefs.budget) {
        best(FeatureKey::BudgetMatchLevel);
    }
    exact(FeatureKey::StatusLevel, statusLevel(trip.status));
    exact(FeatureKey::DepartingSoon, departingSoon(trip, referenceDate));
    exact(FeatureKey::GeoMatchLevel, geoMatchLevel(trip, prefs));

    double bound = 0.0;
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        bound += terms[i];
    }
    return bound;
}

} // namespace st

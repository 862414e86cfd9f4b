#pragma once

#include "core/shared/errors.h"
#include "core/shared/search_preferences.h"
#include "core/shared/settings.h"
#include "core/shared/trip_candidate.h"

#include <QDate>
#include <QJsonArray>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace st {

// Inventory collaborator. Owns trip storage; the core only reads snapshots.
class InventorySource {
public:
    virtual ~InventorySource() = default;

    virtual bool fetchCandidates(const SearchPreferences& prefs,
                                 std::vector<TripCandidate>* out,
                                 Error* errorOut = nullptr) = 0;

    // Wider pass used to top up a short primary result list. Trips listed in
    // excludeIds are never returned.
    virtual bool fetchRelaxedCandidates(const SearchPreferences& prefs,
                                        const std::vector<int64_t>& excludeIds,
                                        std::vector<TripCandidate>* out,
                                        Error* errorOut = nullptr) = 0;
};

// Inventory backed by a JSON array of trips.
//
// The primary pass applies the catalogue's hard filters: bookable status
// with free spots, geography, trip type, upcoming departures within the
// year/month, duration within durationHardFilterDays of the range,
// difficulty within tolerance and price within budgetMaxMultiplier.
//
// The relaxed pass widens countries to their continents, drops the trip
// type and duration filters, widens dates by relaxedDateMonths and uses the
// relaxed difficulty tolerance and budget multiplier.
class JsonInventorySource : public InventorySource {
public:
    JsonInventorySource(std::vector<TripCandidate> trips,
                        QDate referenceDate,
                        FilterSettings filters = {});

    static std::optional<JsonInventorySource> fromJson(const QJsonArray& array,
                                                       QDate referenceDate,
                                                       FilterSettings filters = {},
                                                       Error* errorOut = nullptr);
    static std::optional<JsonInventorySource> load(const QString& filePath,
                                                   QDate referenceDate,
                                                   FilterSettings filters = {},
                                                   Error* errorOut = nullptr);

    bool fetchCandidates(const SearchPreferences& prefs,
                         std::vector<TripCandidate>* out,
                         Error* errorOut = nullptr) override;
    bool fetchRelaxedCandidates(const SearchPreferences& prefs,
                                const std::vector<int64_t>& excludeIds,
                                std::vector<TripCandidate>* out,
                                Error* errorOut = nullptr) override;

    const std::vector<TripCandidate>& trips() const { return m_trips; }

private:
    enum class Pass { Primary, Relaxed };

    bool isOffered(const TripCandidate& trip) const;
    bool passesGeo(const TripCandidate& trip,
                   const SearchPreferences& prefs,
                   const std::vector<Continent>& expandedContinents) const;
    bool passesDates(const TripCandidate& trip, const SearchPreferences& prefs, Pass pass) const;
    bool passesDuration(const TripCandidate& trip, const SearchPreferences& prefs) const;
    bool passesFilters(const TripCandidate& trip,
                       const SearchPreferences& prefs,
                       Pass pass,
                       const std::vector<Continent>& expandedContinents) const;

    // Continents of the selected countries, as listed in the inventory.
    std::vector<Continent> continentsOfCountries(const std::vector<int>& countryIds) const;

    std::vector<TripCandidate> m_trips;
    QDate m_referenceDate;
    FilterSettings m_filters;
};

} // namespace st

#include "services/ranker/inventory_source.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <cstdlib>

namespace st {

JsonInventorySource::JsonInventorySource(std::vector<TripCandidate> trips,
                                         QDate referenceDate,
                                         FilterSettings filters)
    : m_trips(std::move(trips))
    , m_referenceDate(referenceDate)
    , m_filters(filters)
{
}

std::optional<JsonInventorySource> JsonInventorySource::fromJson(const QJsonArray& array,
                                                                 QDate referenceDate,
                                                                 FilterSettings filters,
                                                                 Error* errorOut)
{
    std::vector<TripCandidate> trips;
    trips.reserve(static_cast<std::size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        Error error;
        auto trip = tripCandidateFromJson(array.at(i).toObject(), &error);
        if (!trip) {
            fail(errorOut, ErrorKind::InventoryUnavailable,
                 QStringLiteral("trip #%1: %2").arg(i).arg(error.message));
            return std::nullopt;
        }
        trips.push_back(std::move(*trip));
    }
    return JsonInventorySource(std::move(trips), referenceDate, filters);
}

std::optional<JsonInventorySource> JsonInventorySource::load(const QString& filePath,
                                                             QDate referenceDate,
                                                             FilterSettings filters,
                                                             Error* errorOut)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(stCore, "Failed to open inventory file: %s", qUtf8Printable(filePath));
        fail(errorOut, ErrorKind::InventoryUnavailable, QStringLiteral("cannot read %1").arg(filePath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        fail(errorOut, ErrorKind::InventoryUnavailable,
             QStringLiteral("%1 is not a JSON array of trips: %2")
                 .arg(filePath, parseError.errorString()));
        return std::nullopt;
    }
    return fromJson(doc.array(), referenceDate, filters, errorOut);
}

bool JsonInventorySource::isOffered(const TripCandidate& trip) const
{
    if (!isBookable(trip.status)) {
        return false;
    }
    // Private groups are arranged on request and have no seat count.
    return trip.privateGroup || !trip.spotsLeft || *trip.spotsLeft > 0;
}

bool JsonInventorySource::passesGeo(const TripCandidate& trip,
                                    const SearchPreferences& prefs,
                                    const std::vector<Continent>& expandedContinents) const
{
    if (prefs.countryIds.empty() && prefs.continents.empty()) {
        return true;
    }
    if (std::binary_search(prefs.countryIds.begin(), prefs.countryIds.end(), trip.countryId)
        || std::binary_search(prefs.continents.begin(), prefs.continents.end(), trip.continent)) {
        return true;
    }
    return std::find(expandedContinents.begin(), expandedContinents.end(), trip.continent)
        != expandedContinents.end();
}

bool JsonInventorySource::passesDates(const TripCandidate& trip,
                                      const SearchPreferences& prefs,
                                      Pass pass) const
{
    // Private groups run on request and carry no fixed dates.
    if (trip.privateGroup || !trip.departureDate.isValid()) {
        return true;
    }
    const QDate departure = trip.departureDate;
    if (departure < m_referenceDate
        || departure.year() > m_referenceDate.year() + m_filters.maxYearsAhead) {
        return false;
    }
    if (!prefs.year) {
        return true;
    }

    if (pass == Pass::Primary) {
        if (departure.year() != *prefs.year) {
            return false;
        }
        return !prefs.month || departure.month() == *prefs.month;
    }

    const int widen = m_filters.relaxedDateMonths;
    QDate from;
    QDate to;
    if (prefs.month) {
        const QDate center(*prefs.year, *prefs.month, 1);
        from = center.addMonths(-widen);
        to = center.addMonths(widen + 1).addDays(-1);
    } else {
        from = QDate(*prefs.year, 1, 1).addMonths(-widen);
        to = QDate(*prefs.year, 12, 31).addMonths(widen);
    }
    from = std::max(from, m_referenceDate);
    return departure >= from && departure <= to;
}

bool JsonInventorySource::passesDuration(const TripCandidate& trip,
                                         const SearchPreferences& prefs) const
{
    if (trip.privateGroup || (!prefs.minDurationDays && !prefs.maxDurationDays)) {
        return true;
    }
    const int lo = prefs.minDurationDays.value_or(0);
    const int hi = prefs.maxDurationDays.value_or(trip.durationDays);
    int distance = 0;
    if (trip.durationDays < lo) {
        distance = lo - trip.durationDays;
    } else if (trip.durationDays > hi) {
        distance = trip.durationDays - hi;
    }
    return distance <= m_filters.durationHardFilterDays;
}

bool JsonInventorySource::passesFilters(const TripCandidate& trip,
                                        const SearchPreferences& prefs,
                                        Pass pass,
                                        const std::vector<Continent>& expandedContinents) const
{
    const bool primary = pass == Pass::Primary;
    if (!isOffered(trip) || !passesGeo(trip, prefs, expandedContinents)) {
        return false;
    }
    if (primary && prefs.tripTypeId && trip.tripTypeId != *prefs.tripTypeId) {
        return false;
    }
    if (!passesDates(trip, prefs, pass)) {
        return false;
    }
    if (primary && !passesDuration(trip, prefs)) {
        return false;
    }

    const int tolerance = primary ? m_filters.difficultyTolerance
                                  : m_filters.relaxedDifficultyTolerance;
    if (prefs.difficulty && std::abs(trip.difficultyLevel - *prefs.difficulty) > tolerance) {
        return false;
    }

    const double multiplier = primary ? m_filters.budgetMaxMultiplier
                                      : m_filters.relaxedBudgetMultiplier;
    if (prefs.budget && trip.price > *prefs.budget * multiplier) {
        return false;
    }
    return true;
}

std::vector<Continent> JsonInventorySource::continentsOfCountries(
    const std::vector<int>& countryIds) const
{
    std::vector<Continent> continents;
    if (countryIds.empty()) {
        return continents;
    }
    for (const TripCandidate& trip : m_trips) {
        if (std::binary_search(countryIds.begin(), countryIds.end(), trip.countryId)
            && std::find(continents.begin(), continents.end(), trip.continent) == continents.end()) {
            continents.push_back(trip.continent);
        }
    }
    return continents;
}

bool JsonInventorySource::fetchCandidates(const SearchPreferences& prefs,
                                          std::vector<TripCandidate>* out,
                                          Error* errorOut)
{
    if (!out) {
        return fail(errorOut, ErrorKind::InventoryUnavailable, QStringLiteral("no output vector"));
    }
    out->clear();
    const std::vector<Continent> noExpansion;
    for (const TripCandidate& trip : m_trips) {
        if (passesFilters(trip, prefs, Pass::Primary, noExpansion)) {
            out->push_back(trip);
        }
    }
    LOG_DEBUG(stCore, "Inventory returned %d of %d trips",
              static_cast<int>(out->size()), static_cast<int>(m_trips.size()));
    return true;
}

bool JsonInventorySource::fetchRelaxedCandidates(const SearchPreferences& prefs,
                                                 const std::vector<int64_t>& excludeIds,
                                                 std::vector<TripCandidate>* out,
                                                 Error* errorOut)
{
    if (!out) {
        return fail(errorOut, ErrorKind::InventoryUnavailable, QStringLiteral("no output vector"));
    }
    out->clear();
    const std::vector<Continent> expanded = continentsOfCountries(prefs.countryIds);
    for (const TripCandidate& trip : m_trips) {
        if (std::find(excludeIds.begin(), excludeIds.end(), trip.tripId) != excludeIds.end()) {
            continue;
        }
        if (passesFilters(trip, prefs, Pass::Relaxed, expanded)) {
            out->push_back(trip);
        }
    }
    LOG_DEBUG(stCore, "Relaxed inventory pass returned %d trips", static_cast<int>(out->size()));
    return true;
}

} // namespace st

#pragma once

#include <QString>
#include <optional>

namespace st {

// Availability of a trip occurrence as reported by the inventory.
enum class TripStatus {
    Available,
    Guaranteed,
    LastPlaces,
    Full,
    Cancelled,
};

QString tripStatusToString(TripStatus status);
std::optional<TripStatus> tripStatusFromString(const QString& str);

// Full and cancelled occurrences are listed by the inventory but never offered.
inline bool isBookable(TripStatus status)
{
    return status != TripStatus::Full && status != TripStatus::Cancelled;
}

// Declaration order is the canonical sort order for normalized preferences.
enum class Continent {
    Africa,
    Asia,
    Europe,
    NorthAndCentralAmerica,
    SouthAmerica,
    Oceania,
    Antarctica,
};

QString continentToString(Continent continent);

// Accepts enum spellings and the front-end display names, case-insensitive.
std::optional<Continent> continentFromString(const QString& str);

} // namespace st

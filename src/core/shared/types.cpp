#include "core/shared/types.h"

namespace st {

QString tripStatusToString(TripStatus status)
{
    switch (status) {
    case TripStatus::Available:  return QStringLiteral("available");
    case TripStatus::Guaranteed: return QStringLiteral("guaranteed");
    case TripStatus::LastPlaces: return QStringLiteral("last_places");
    case TripStatus::Full:       return QStringLiteral("full");
    case TripStatus::Cancelled:  return QStringLiteral("cancelled");
    }
    return QStringLiteral("available");
}

std::optional<TripStatus> tripStatusFromString(const QString& str)
{
    const QString key = str.trimmed().toLower().replace(QLatin1Char(' '), QLatin1Char('_'));
    if (key == QLatin1String("available") || key == QLatin1String("open")) return TripStatus::Available;
    if (key == QLatin1String("guaranteed"))  return TripStatus::Guaranteed;
    if (key == QLatin1String("last_places")) return TripStatus::LastPlaces;
    if (key == QLatin1String("full"))        return TripStatus::Full;
    if (key == QLatin1String("cancelled") || key == QLatin1String("canceled")) return TripStatus::Cancelled;
    return std::nullopt;
}

QString continentToString(Continent continent)
{
    switch (continent) {
    case Continent::Africa:                 return QStringLiteral("AFRICA");
    case Continent::Asia:                   return QStringLiteral("ASIA");
    case Continent::Europe:                 return QStringLiteral("EUROPE");
    case Continent::NorthAndCentralAmerica: return QStringLiteral("NORTH_AND_CENTRAL_AMERICA");
    case Continent::SouthAmerica:           return QStringLiteral("SOUTH_AMERICA");
    case Continent::Oceania:                return QStringLiteral("OCEANIA");
    case Continent::Antarctica:             return QStringLiteral("ANTARCTICA");
    }
    return QStringLiteral("AFRICA");
}

std::optional<Continent> continentFromString(const QString& str)
{
    QString key = str.trimmed().toUpper();
    key.replace(QLatin1Char('&'), QStringLiteral("AND"));
    key.replace(QLatin1Char(' '), QLatin1Char('_'));
    while (key.contains(QStringLiteral("__"))) {
        key.replace(QStringLiteral("__"), QStringLiteral("_"));
    }

    if (key == QLatin1String("AFRICA"))  return Continent::Africa;
    if (key == QLatin1String("ASIA"))    return Continent::Asia;
    if (key == QLatin1String("EUROPE"))  return Continent::Europe;
    if (key == QLatin1String("NORTH_AND_CENTRAL_AMERICA")
        || key == QLatin1String("NORTH_AMERICA")) {
        return Continent::NorthAndCentralAmerica;
    }
    if (key == QLatin1String("SOUTH_AMERICA")) return Continent::SouthAmerica;
    if (key == QLatin1String("OCEANIA"))       return Continent::Oceania;
    if (key == QLatin1String("ANTARCTICA"))    return Continent::Antarctica;
    return std::nullopt;
}

} // namespace st

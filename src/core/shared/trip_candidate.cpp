#include "core/shared/trip_candidate.h"

#include <QJsonArray>

namespace st {

bool TripCandidate::operator==(const TripCandidate& other) const
{
    return tripId == other.tripId
        && themeTagIds == other.themeTagIds
        && difficultyLevel == other.difficultyLevel
        && durationDays == other.durationDays
        && price == other.price
        && countryId == other.countryId
        && countryName == other.countryName
        && continent == other.continent
        && status == other.status
        && departureDate == other.departureDate
        && tripTypeId == other.tripTypeId
        && privateGroup == other.privateGroup
        && spotsLeft == other.spotsLeft;
}

QJsonObject tripCandidateToJson(const TripCandidate& trip)
{
    QJsonArray themes;
    for (int themeId : trip.themeTagIds) {
        themes.append(themeId);
    }

    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(trip.tripId);
    json[QStringLiteral("themeTagIds")] = themes;
    json[QStringLiteral("difficultyLevel")] = trip.difficultyLevel;
    json[QStringLiteral("durationDays")] = trip.durationDays;
    json[QStringLiteral("price")] = trip.price;
    json[QStringLiteral("countryId")] = trip.countryId;
    json[QStringLiteral("countryName")] = trip.countryName;
    json[QStringLiteral("continent")] = continentToString(trip.continent);
    json[QStringLiteral("status")] = tripStatusToString(trip.status);
    json[QStringLiteral("departureDate")] = trip.departureDate.isValid()
        ? trip.departureDate.toString(Qt::ISODate)
        : QString();
    json[QStringLiteral("tripTypeId")] = trip.tripTypeId;
    json[QStringLiteral("privateGroup")] = trip.privateGroup;
    if (trip.spotsLeft) {
        json[QStringLiteral("spotsLeft")] = *trip.spotsLeft;
    }
    return json;
}

std::optional<TripCandidate> tripCandidateFromJson(const QJsonObject& json, Error* errorOut)
{
    TripCandidate trip;

    const QJsonValue id = json.value(QStringLiteral("id"));
    if (!id.isDouble()) {
        fail(errorOut, ErrorKind::InventoryUnavailable, QStringLiteral("trip is missing a numeric id"));
        return std::nullopt;
    }
    trip.tripId = static_cast<int64_t>(id.toDouble());

    const QJsonArray themes = json.value(QStringLiteral("themeTagIds")).toArray();
    trip.themeTagIds.reserve(static_cast<size_t>(themes.size()));
    for (const QJsonValue& value : themes) {
        trip.themeTagIds.push_back(value.toInt());
    }

    trip.difficultyLevel = json.value(QStringLiteral("difficultyLevel")).toInt();
    trip.durationDays = json.value(QStringLiteral("durationDays")).toInt();
    trip.price = json.value(QStringLiteral("price")).toDouble();
    trip.countryId = json.value(QStringLiteral("countryId")).toInt();
    trip.countryName = json.value(QStringLiteral("countryName")).toString();
    trip.tripTypeId = json.value(QStringLiteral("tripTypeId")).toInt();
    trip.privateGroup = json.value(QStringLiteral("privateGroup")).toBool(false);
    const QJsonValue spots = json.value(QStringLiteral("spotsLeft"));
    if (spots.isDouble()) {
        trip.spotsLeft = spots.toInt();
    }

    const auto continent = continentFromString(json.value(QStringLiteral("continent")).toString());
    if (!continent) {
        fail(errorOut, ErrorKind::InventoryUnavailable,
             QStringLiteral("trip %1 has an unknown continent").arg(trip.tripId));
        return std::nullopt;
    }
    trip.continent = *continent;

    const QString statusText = json.value(QStringLiteral("status")).toString(QStringLiteral("available"));
    const auto status = tripStatusFromString(statusText);
    if (!status) {
        fail(errorOut, ErrorKind::InventoryUnavailable,
             QStringLiteral("trip %1 has an unknown status '%2'").arg(trip.tripId).arg(statusText));
        return std::nullopt;
    }
    trip.status = *status;

    const QString departure = json.value(QStringLiteral("departureDate")).toString();
    if (!departure.isEmpty()) {
        trip.departureDate = QDate::fromString(departure, Qt::ISODate);
    }

    return trip;
}

} // namespace st

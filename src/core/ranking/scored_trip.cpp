#include "core/ranking/scored_trip.h"

namespace st {

QJsonObject ScoredTrip::toJson() const
{
    QJsonObject featureJson;
    QJsonObject contributionJson;
    for (FeatureKey key : kAllFeatureKeys) {
        const QString name = featureKeyToString(key);
        featureJson.insert(name, features.value(key));
        contributionJson.insert(name, contributions[featureIndex(key)]);
    }

    QJsonObject json;
    json.insert(QStringLiteral("tripId"), static_cast<qint64>(trip.tripId));
    json.insert(QStringLiteral("score"), score);
    json.insert(QStringLiteral("weightVersion"), static_cast<qint64>(weightVersion));
    json.insert(QStringLiteral("trip"), tripCandidateToJson(trip));
    json.insert(QStringLiteral("features"), featureJson);
    json.insert(QStringLiteral("contributions"), contributionJson);
    json.insert(QStringLiteral("relaxed"), relaxed);
    json.insert(QStringLiteral("penalty"), penalty);
    return json;
}

} // namespace st

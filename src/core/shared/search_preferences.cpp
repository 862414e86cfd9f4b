#include "core/shared/search_preferences.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>

namespace st {

namespace {

QJsonValue optionalInt(const std::optional<int>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonArray intArray(const std::vector<int>& values)
{
    QJsonArray array;
    for (int value : values) {
        array.append(value);
    }
    return array;
}

} // namespace

bool SearchPreferences::operator==(const SearchPreferences& other) const
{
    return countryIds == other.countryIds
        && continents == other.continents
        && tripTypeId == other.tripTypeId
        && themeIds == other.themeIds
        && budget == other.budget
        && minDurationDays == other.minDurationDays
        && maxDurationDays == other.maxDurationDays
        && difficulty == other.difficulty
        && year == other.year
        && month == other.month;
}

QJsonObject SearchPreferences::toJson() const
{
    QJsonArray continentArray;
    for (Continent continent : continents) {
        continentArray.append(continentToString(continent));
    }

    // QJsonObject keeps keys sorted, which fixes the serialized key order.
    QJsonObject json;
    json[QStringLiteral("budget")] = budget ? QJsonValue(*budget) : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("continents")] = continentArray;
    json[QStringLiteral("countries")] = intArray(countryIds);
    json[QStringLiteral("difficulty")] = optionalInt(difficulty);
    json[QStringLiteral("maxDuration")] = optionalInt(maxDurationDays);
    json[QStringLiteral("minDuration")] = optionalInt(minDurationDays);
    json[QStringLiteral("month")] = optionalInt(month);
    json[QStringLiteral("themes")] = intArray(themeIds);
    json[QStringLiteral("tripType")] = optionalInt(tripTypeId);
    json[QStringLiteral("year")] = optionalInt(year);
    return json;
}

QByteArray SearchPreferences::canonicalBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

QString SearchPreferences::fingerprint() const
{
    const QByteArray hash = QCryptographicHash::hash(canonicalBytes(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace st

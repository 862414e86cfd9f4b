#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace st {

// Normalized search preferences. Produced only by PreferenceNormalizer, so
// id sets are sorted and de-duplicated and min <= max duration holds.
struct SearchPreferences {
    std::vector<int> countryIds;
    std::vector<Continent> continents;
    std::optional<int> tripTypeId;
    std::vector<int> themeIds;
    std::optional<double> budget;
    std::optional<int> minDurationDays;
    std::optional<int> maxDurationDays;
    std::optional<int> difficulty;
    std::optional<int> year;
    std::optional<int> month;

    bool operator==(const SearchPreferences& other) const;
    bool operator!=(const SearchPreferences& other) const { return !(*this == other); }

    // Compact JSON with a fixed key order; identical preferences always give
    // identical bytes.
    QByteArray canonicalBytes() const;

    // SHA-256 hex of canonicalBytes(). Used as the score cache key part.
    QString fingerprint() const;

    QJsonObject toJson() const;
};

} // namespace st

#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QDate>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace st {

// Snapshot of one trip occurrence supplied by the inventory. Borrowed
// read-only for the duration of a scoring call.
struct TripCandidate {
    int64_t tripId = 0;
    std::vector<int> themeTagIds;
    int difficultyLevel = 0;   // 1..5
    int durationDays = 0;
    double price = 0.0;
    int countryId = 0;
    QString countryName;
    Continent continent = Continent::Africa;
    TripStatus status = TripStatus::Available;
    QDate departureDate;
    int tripTypeId = 0;
    bool privateGroup = false; // flexible dates and duration
    std::optional<int> spotsLeft;  // unset when the inventory does not track it

    bool operator==(const TripCandidate& other) const;
    bool operator!=(const TripCandidate& other) const { return !(*this == other); }
};

QJsonObject tripCandidateToJson(const TripCandidate& trip);

// Decodes the inventory JSON encoding (camelCase keys, ISO departure date).
std::optional<TripCandidate> tripCandidateFromJson(const QJsonObject& json,
                                                   Error* errorOut = nullptr);

} // namespace st

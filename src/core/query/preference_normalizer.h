#pragma once

#include "core/shared/errors.h"
#include "core/shared/search_preferences.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace st {

// Turns the raw front-end preference payload into SearchPreferences.
//
// Recognized keys: selected_countries, selected_continents,
// preferred_type_id, preferred_theme_ids, min_duration, max_duration,
// budget, difficulty, year, month. Numbers may be JSON numbers or numeric
// strings. "all" for year/month and a zero budget mean "not set".
class PreferenceNormalizer {
public:
    static std::optional<SearchPreferences> normalize(const QJsonObject& raw,
                                                      Error* errorOut = nullptr);

    // SHA-256 hex of the compact raw payload. Key for the normalization cache.
    static QString rawFingerprint(const QJsonObject& raw);
};

} // namespace st

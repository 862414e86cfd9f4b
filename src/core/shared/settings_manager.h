#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace st {

// SettingsManager -- JSON save/load for engine settings.
//
// Default location:
//   <GenericDataLocation>/smarttrip/ranker.json
// Missing keys keep their defaults, unknown keys are ignored and numeric
// values are clamped to sane ranges on load.
class SettingsManager {
public:
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<EngineSettings> load(const QString& filePath = settingsFilePath());

    // Creates the parent directory if needed. Returns true on success.
    static bool save(const EngineSettings& settings, const QString& filePath = settingsFilePath());

    static QString settingsFilePath();

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace st

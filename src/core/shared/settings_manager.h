#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace dd {

// SettingsManager -- JSON save/load for daemon settings.
//
// Settings are stored as a JSON file at:
//   $DAEDALUS_DATA_DIR/settings.json
// falling back to <GenericDataLocation>/daedalus/settings.json.
//
// The file is grouped by section:
//   { "suggestions": {...}, "privacy": {...}, "index": {...}, "daemon": {...} }
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    // Per-user directory holding the history database, index and settings.
    static QString dataDirectory();
    static QString settingsFilePath();

    // Convert settings to/from JSON. Missing keys keep their defaults.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace dd

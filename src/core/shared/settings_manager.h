#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace dq {

// SettingsManager -- JSON save/load for application settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/docquery/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> loadFromFile(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool saveToFile(const Settings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. Missing keys keep their defaults.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);

    // OLLAMA_URL, OLLAMA_MODEL and DOCQUERY_DATA_DIR override the
    // corresponding fields when set and non-empty.
    static Settings applyEnvironment(Settings settings,
                                     const QProcessEnvironment& env
                                         = QProcessEnvironment::systemEnvironment());

    // Fill empty path fields with their defaults under dataDir.
    static Settings resolvePaths(Settings settings);

    // Startup configuration: the settings file (defaults when absent or
    // unreadable), then environment overrides, then resolved paths.
    static Settings loadEffective(const QString& filePath = settingsFilePath(),
                                  const QProcessEnvironment& env
                                      = QProcessEnvironment::systemEnvironment());
};

} // namespace dq

#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace dr {

// SettingsManager -- JSON save/load for docrag settings plus environment
// overrides.
//
// Settings are stored as a JSON file at:
//   <AppConfigLocation>/docrag/settings.json
class SettingsManager {
public:
    // Load settings from filePath (or the default location when empty).
    // Returns nullopt if the file doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = {});

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings, const QString& filePath = {});

    static QString settingsFilePath();

    // Default storage directory for the index and cache files.
    static QString dataDirectory();

    // Applies RAG_* / EMBEDDING_* style variables on top of settings.
    // Values that fail to parse are logged and ignored.
    static void applyEnvironment(Settings& settings,
                                 const QProcessEnvironment& env =
                                     QProcessEnvironment::systemEnvironment());

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace dr

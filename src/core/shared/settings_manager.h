#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ox {

// SettingsManager -- JSON save/load for engine settings.
//
// The default location is $XDG_CONFIG_HOME/obsidex/settings.json (or the
// platform equivalent). Environment overrides are applied on top of whatever
// was loaded:
//   OBSIDEX_API_KEY (falls back to OPENAI_API_KEY)
//   OBSIDEX_VAULT_PATH
//   OBSIDEX_EMBEDDING_BASE_URL
class SettingsManager {
public:
    // Load settings from a JSON file. Returns nullopt if the file doesn't
    // exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings,
                     const QString& filePath = settingsFilePath());

    static QString settingsFilePath();

    // Database path, resolving the empty default against the vault root.
    static QString resolvedDbPath(const Settings& settings);

    static void applyEnvironment(Settings& settings);

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace ox

#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cr {

// SettingsManager -- JSON save/load and environment overlay for the
// correction settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/correctiveretrieval/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist,
    // cannot be parsed, or holds invalid values.
    static std::optional<CorrectionSettings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const CorrectionSettings& settings,
                     const QString& filePath = settingsFilePath());

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. Missing keys keep their defaults.
    static QJsonObject toJson(const CorrectionSettings& settings);
    static CorrectionSettings fromJson(const QJsonObject& json);

    // Overlays the RAG_CRAG_*, RAG_ENABLE_*, CIRCUIT_* and RETRY_* variables.
    // Durations in the environment are seconds.
    static CorrectionSettings applyEnvironment(CorrectionSettings settings);

    // Defaults plus the environment, validated.
    static std::optional<CorrectionSettings> fromEnvironment();

    // Returns nullopt (and logs why) when any section fails validation.
    static std::optional<CorrectionSettings> validated(CorrectionSettings settings);
};

} // namespace cr

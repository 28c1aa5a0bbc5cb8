#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QtGlobal>

#include <cmath>
#include <stdexcept>

namespace {

std::optional<QString> envValue(const char* name)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return std::nullopt;
    }
    const QString value = qEnvironmentVariable(name).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

void overlayDouble(const char* name, double& target)
{
    const std::optional<QString> raw = envValue(name);
    if (!raw) {
        return;
    }
    bool ok = false;
    const double value = raw->toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        LOG_WARN(crCore, "Ignoring %s: '%s' is not a number", name, qUtf8Printable(*raw));
        return;
    }
    target = value;
}

void overlayInt(const char* name, int& target)
{
    const std::optional<QString> raw = envValue(name);
    if (!raw) {
        return;
    }
    bool ok = false;
    const int value = raw->toInt(&ok);
    if (!ok) {
        LOG_WARN(crCore, "Ignoring %s: '%s' is not an integer", name, qUtf8Printable(*raw));
        return;
    }
    target = value;
}

// Seconds in the environment, milliseconds in the settings.
void overlaySecondsAsMs(const char* name, int& targetMs)
{
    double seconds = static_cast<double>(targetMs) / 1000.0;
    const double before = seconds;
    overlayDouble(name, seconds);
    if (seconds != before) {
        targetMs = static_cast<int>(std::lround(seconds * 1000.0));
    }
}

void overlayBool(const char* name, bool& target)
{
    const std::optional<QString> raw = envValue(name);
    if (!raw) {
        return;
    }
    const QString value = raw->toLower();
    if (value == QLatin1String("true") || value == QLatin1String("1")
        || value == QLatin1String("yes") || value == QLatin1String("on")) {
        target = true;
    } else if (value == QLatin1String("false") || value == QLatin1String("0")
               || value == QLatin1String("no") || value == QLatin1String("off")) {
        target = false;
    } else {
        LOG_WARN(crCore, "Ignoring %s: '%s' is not a boolean", name, qUtf8Printable(*raw));
    }
}

} // namespace

namespace cr {

std::optional<CorrectionSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(crCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(crCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return validated(fromJson(doc.object()));
}

bool SettingsManager::save(const CorrectionSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(crCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(crCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(crCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/correctiveretrieval/settings.json");
}

QJsonObject SettingsManager::toJson(const CorrectionSettings& settings)
{
    const GateConfigValues& g = settings.gate;
    QJsonObject gate;
    gate.insert(QStringLiteral("minBestScore"), g.minBestScore);
    gate.insert(QStringLiteral("minAvgTop3Score"), g.minAvgTop3Score);
    gate.insert(QStringLiteral("strongBestThreshold"), g.strongBestThreshold);
    gate.insert(QStringLiteral("strongAvgThreshold"), g.strongAvgThreshold);
    gate.insert(QStringLiteral("maxRetryRounds"), g.maxRetryRounds);
    gate.insert(QStringLiteral("multiQueryEnabled"), g.multiQueryEnabled);
    gate.insert(QStringLiteral("hydeEnabled"), g.hydeEnabled);
    gate.insert(QStringLiteral("multiQueryFanout"), g.multiQueryFanout);
    gate.insert(QStringLiteral("aggressiveTopKMultiplier"), g.aggressiveTopKMultiplier);
    gate.insert(QStringLiteral("aggressiveLexicalWeight"), g.aggressiveLexicalWeight);
    gate.insert(QStringLiteral("aggressiveSemanticWeight"), g.aggressiveSemanticWeight);

    QJsonObject breaker;
    breaker.insert(QStringLiteral("failureThreshold"), settings.breaker.failureThreshold);
    breaker.insert(QStringLiteral("recoveryTimeoutMs"), settings.breaker.recoveryTimeoutMs);
    breaker.insert(QStringLiteral("halfOpenMaxCalls"), settings.breaker.halfOpenMaxCalls);

    QJsonObject retry;
    retry.insert(QStringLiteral("maxAttempts"), settings.retry.maxAttempts);
    retry.insert(QStringLiteral("baseDelayMs"), settings.retry.baseDelayMs);
    retry.insert(QStringLiteral("maxDelayMs"), settings.retry.maxDelayMs);
    retry.insert(QStringLiteral("exponentialBase"), settings.retry.exponentialBase);
    retry.insert(QStringLiteral("jitter"), settings.retry.jitter);

    QJsonObject breakerNames;
    breakerNames.insert(QStringLiteral("search"), settings.searchBreakerName);
    breakerNames.insert(QStringLiteral("multiQuery"), settings.multiQueryBreakerName);
    breakerNames.insert(QStringLiteral("hyde"), settings.hydeBreakerName);

    QJsonObject json;
    json.insert(QStringLiteral("gate"), gate);
    json.insert(QStringLiteral("circuitBreaker"), breaker);
    json.insert(QStringLiteral("retry"), retry);
    json.insert(QStringLiteral("breakerNames"), breakerNames);
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    return json;
}

CorrectionSettings SettingsManager::fromJson(const QJsonObject& json)
{
    CorrectionSettings settings;

    const QJsonObject gate = json.value(QStringLiteral("gate")).toObject();
    GateConfigValues& g = settings.gate;
    g.minBestScore = gate.value(QStringLiteral("minBestScore")).toDouble(g.minBestScore);
    g.minAvgTop3Score = gate.value(QStringLiteral("minAvgTop3Score")).toDouble(g.minAvgTop3Score);
    g.strongBestThreshold = gate.value(QStringLiteral("strongBestThreshold"))
                                .toDouble(g.strongBestThreshold);
    g.strongAvgThreshold = gate.value(QStringLiteral("strongAvgThreshold"))
                               .toDouble(g.strongAvgThreshold);
    g.maxRetryRounds = gate.value(QStringLiteral("maxRetryRounds")).toInt(g.maxRetryRounds);
    g.multiQueryEnabled = gate.value(QStringLiteral("multiQueryEnabled")).toBool(g.multiQueryEnabled);
    g.hydeEnabled = gate.value(QStringLiteral("hydeEnabled")).toBool(g.hydeEnabled);
    g.multiQueryFanout = gate.value(QStringLiteral("multiQueryFanout")).toInt(g.multiQueryFanout);
    g.aggressiveTopKMultiplier = gate.value(QStringLiteral("aggressiveTopKMultiplier"))
                                     .toDouble(g.aggressiveTopKMultiplier);
    g.aggressiveLexicalWeight = gate.value(QStringLiteral("aggressiveLexicalWeight"))
                                    .toDouble(g.aggressiveLexicalWeight);
    g.aggressiveSemanticWeight = gate.value(QStringLiteral("aggressiveSemanticWeight"))
                                     .toDouble(g.aggressiveSemanticWeight);

    const QJsonObject breaker = json.value(QStringLiteral("circuitBreaker")).toObject();
    settings.breaker.failureThreshold = breaker.value(QStringLiteral("failureThreshold"))
                                            .toInt(settings.breaker.failureThreshold);
    settings.breaker.recoveryTimeoutMs = breaker.value(QStringLiteral("recoveryTimeoutMs"))
                                             .toInt(settings.breaker.recoveryTimeoutMs);
    settings.breaker.halfOpenMaxCalls = breaker.value(QStringLiteral("halfOpenMaxCalls"))
                                            .toInt(settings.breaker.halfOpenMaxCalls);

    const QJsonObject retry = json.value(QStringLiteral("retry")).toObject();
    settings.retry.maxAttempts = retry.value(QStringLiteral("maxAttempts"))
                                     .toInt(settings.retry.maxAttempts);
    settings.retry.baseDelayMs = retry.value(QStringLiteral("baseDelayMs"))
                                     .toInt(settings.retry.baseDelayMs);
    settings.retry.maxDelayMs = retry.value(QStringLiteral("maxDelayMs"))
                                    .toInt(settings.retry.maxDelayMs);
    settings.retry.exponentialBase = retry.value(QStringLiteral("exponentialBase"))
                                         .toDouble(settings.retry.exponentialBase);
    settings.retry.jitter = retry.value(QStringLiteral("jitter")).toBool(settings.retry.jitter);

    const QJsonObject names = json.value(QStringLiteral("breakerNames")).toObject();
    settings.searchBreakerName = names.value(QStringLiteral("search"))
                                     .toString(settings.searchBreakerName);
    settings.multiQueryBreakerName = names.value(QStringLiteral("multiQuery"))
                                         .toString(settings.multiQueryBreakerName);
    settings.hydeBreakerName = names.value(QStringLiteral("hyde")).toString(settings.hydeBreakerName);

    settings.rrfK = json.value(QStringLiteral("rrfK")).toInt(settings.rrfK);

    return settings;
}

CorrectionSettings SettingsManager::applyEnvironment(CorrectionSettings settings)
{
    GateConfigValues& g = settings.gate;
    overlayDouble("RAG_CRAG_MIN_BEST_SCORE", g.minBestScore);
    overlayDouble("RAG_CRAG_MIN_AVG_SCORE", g.minAvgTop3Score);
    overlayInt("RAG_CRAG_MAX_RETRIES", g.maxRetryRounds);
    overlayBool("RAG_ENABLE_MULTIQUERY", g.multiQueryEnabled);
    overlayBool("RAG_ENABLE_HYDE", g.hydeEnabled);
    overlayInt("RAG_MULTIQUERY_MAX", g.multiQueryFanout);

    overlayInt("CIRCUIT_FAILURE_THRESHOLD", settings.breaker.failureThreshold);
    overlaySecondsAsMs("CIRCUIT_RECOVERY_TIMEOUT", settings.breaker.recoveryTimeoutMs);
    overlayInt("CIRCUIT_HALF_OPEN_MAX_CALLS", settings.breaker.halfOpenMaxCalls);

    overlayInt("RETRY_MAX_ATTEMPTS", settings.retry.maxAttempts);
    overlaySecondsAsMs("RETRY_BASE_DELAY", settings.retry.baseDelayMs);
    overlaySecondsAsMs("RETRY_MAX_DELAY", settings.retry.maxDelayMs);
    overlayDouble("RETRY_EXPONENTIAL_BASE", settings.retry.exponentialBase);
    overlayBool("RETRY_JITTER", settings.retry.jitter);

    return settings;
}

std::optional<CorrectionSettings> SettingsManager::fromEnvironment()
{
    return validated(applyEnvironment(CorrectionSettings()));
}

std::optional<CorrectionSettings> SettingsManager::validated(CorrectionSettings settings)
{
    try {
        const GateConfig gate(settings.gate);
        settings.breaker.validate();
        settings.retry.validate();
    } catch (const std::invalid_argument& error) {
        LOG_WARN(crCore, "Rejecting settings: %s", error.what());
        return std::nullopt;
    }

    if (settings.rrfK < 1) {
        LOG_WARN(crCore, "Rejecting settings: rrfK must be >= 1 (got %d)", settings.rrfK);
        return std::nullopt;
    }
    if (settings.searchBreakerName.isEmpty() || settings.multiQueryBreakerName.isEmpty()
        || settings.hydeBreakerName.isEmpty()) {
        LOG_WARN(crCore, "Rejecting settings: breaker names must not be empty");
        return std::nullopt;
    }
    return settings;
}

} // namespace cr

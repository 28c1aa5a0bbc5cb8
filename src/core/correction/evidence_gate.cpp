#include "core/correction/evidence_gate.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {

double roundTo4(double value)
{
    return std::round(value * 10000.0) / 10000.0;
}

void requireNonNegative(double value, const char* field)
{
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument(std::string("GateConfig.") + field
                                    + " must be a finite value >= 0");
    }
}

void requireUnitInterval(double value, const char* field)
{
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string("GateConfig.") + field
                                    + " must be within [0, 1]");
    }
}

template <typename T>
void applyOverride(T& target, const std::optional<T>& value)
{
    if (value.has_value()) {
        target = *value;
    }
}

} // namespace

namespace cr {

QString evidenceLevelToString(EvidenceLevel level)
{
    switch (level) {
    case EvidenceLevel::Strong:       return QStringLiteral("strong");
    case EvidenceLevel::Moderate:     return QStringLiteral("moderate");
    case EvidenceLevel::Low:          return QStringLiteral("low");
    case EvidenceLevel::Insufficient: return QStringLiteral("insufficient");
    }
    return QStringLiteral("unknown");
}

std::optional<EvidenceLevel> evidenceLevelFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("strong")) {
        return EvidenceLevel::Strong;
    }
    if (normalized == QLatin1String("moderate")) {
        return EvidenceLevel::Moderate;
    }
    if (normalized == QLatin1String("low")) {
        return EvidenceLevel::Low;
    }
    if (normalized == QLatin1String("insufficient")) {
        return EvidenceLevel::Insufficient;
    }
    return std::nullopt;
}

double evidenceConfidence(EvidenceLevel level)
{
    switch (level) {
    case EvidenceLevel::Strong:       return 1.0;
    case EvidenceLevel::Moderate:     return 0.7;
    case EvidenceLevel::Low:          return 0.4;
    case EvidenceLevel::Insufficient: return 0.1;
    }
    return 0.0;
}

bool requiresCorrection(EvidenceLevel level)
{
    return level == EvidenceLevel::Low || level == EvidenceLevel::Insufficient;
}

bool isAcceptable(EvidenceLevel level)
{
    return level == EvidenceLevel::Strong || level == EvidenceLevel::Moderate;
}

bool GateConfigOverrides::isEmpty() const
{
    return !minBestScore && !minAvgTop3Score && !strongBestThreshold && !strongAvgThreshold
        && !maxRetryRounds && !multiQueryEnabled && !hydeEnabled && !multiQueryFanout
        && !aggressiveTopKMultiplier && !aggressiveLexicalWeight && !aggressiveSemanticWeight;
}

GateConfig::GateConfig()
    : GateConfig(GateConfigValues())
{
}

GateConfig::GateConfig(const GateConfigValues& values)
    : m_values(values)
{
    validate(m_values);
}

void GateConfig::validate(const GateConfigValues& values)
{
    requireNonNegative(values.minBestScore, "minBestScore");
    requireNonNegative(values.minAvgTop3Score, "minAvgTop3Score");
    requireNonNegative(values.strongBestThreshold, "strongBestThreshold");
    requireNonNegative(values.strongAvgThreshold, "strongAvgThreshold");
    if (values.maxRetryRounds < 0) {
        throw std::invalid_argument("GateConfig.maxRetryRounds must be >= 0");
    }
    if (values.multiQueryFanout < 1) {
        throw std::invalid_argument("GateConfig.multiQueryFanout must be >= 1");
    }
    if (!std::isfinite(values.aggressiveTopKMultiplier) || values.aggressiveTopKMultiplier < 1.0) {
        throw std::invalid_argument("GateConfig.aggressiveTopKMultiplier must be >= 1");
    }
    requireUnitInterval(values.aggressiveLexicalWeight, "aggressiveLexicalWeight");
    requireUnitInterval(values.aggressiveSemanticWeight, "aggressiveSemanticWeight");
}

GateConfig GateConfig::withOverrides(const GateConfigOverrides& overrides) const
{
    GateConfigValues values = m_values;
    applyOverride(values.minBestScore, overrides.minBestScore);
    applyOverride(values.minAvgTop3Score, overrides.minAvgTop3Score);
    applyOverride(values.strongBestThreshold, overrides.strongBestThreshold);
    applyOverride(values.strongAvgThreshold, overrides.strongAvgThreshold);
    applyOverride(values.maxRetryRounds, overrides.maxRetryRounds);
    applyOverride(values.multiQueryEnabled, overrides.multiQueryEnabled);
    applyOverride(values.hydeEnabled, overrides.hydeEnabled);
    applyOverride(values.multiQueryFanout, overrides.multiQueryFanout);
    applyOverride(values.aggressiveTopKMultiplier, overrides.aggressiveTopKMultiplier);
    applyOverride(values.aggressiveLexicalWeight, overrides.aggressiveLexicalWeight);
    applyOverride(values.aggressiveSemanticWeight, overrides.aggressiveSemanticWeight);
    return GateConfig(values);
}

QString GateEvaluation::reason() const
{
    return reasons.join(QStringLiteral("; "));
}

QString GateEvaluation::toString() const
{
    return QStringLiteral("GateEvaluation(%1, level=%2, best=%3, avg=%4, n=%5)")
        .arg(gatePassed ? QStringLiteral("PASSED") : QStringLiteral("FAILED"),
             evidenceLevelToString(evidenceLevel))
        .arg(bestScore, 0, 'f', 3)
        .arg(avgTop3Score, 0, 'f', 3)
        .arg(resultCount);
}

QJsonObject GateEvaluation::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("gatePassed")] = gatePassed;
    json[QStringLiteral("evidenceLevel")] = evidenceLevelToString(evidenceLevel);
    json[QStringLiteral("bestScore")] = roundTo4(bestScore);
    json[QStringLiteral("avgTop3Score")] = roundTo4(avgTop3Score);
    json[QStringLiteral("resultCount")] = resultCount;
    json[QStringLiteral("reasons")] = QJsonArray::fromStringList(reasons);
    json[QStringLiteral("recommendedActions")] = QJsonArray::fromStringList(recommendedActions);
    json[QStringLiteral("confidence")] = confidence();
    return json;
}

EvidenceGate::EvidenceGate(GateConfig config)
    : m_config(std::move(config))
{
}

GateEvaluation EvidenceGate::evaluate(const ResultList& results) const
{
    GateEvaluation evaluation;
    if (results.empty()) {
        evaluation.gatePassed = false;
        evaluation.evidenceLevel = EvidenceLevel::Insufficient;
        evaluation.reasons = {QStringLiteral("No results returned from search")};
        evaluation.recommendedActions = {
            QLatin1String(kStrategyMultiQuery),
            QLatin1String(kStrategyHyde),
            QLatin1String(kStrategyExpandSources),
        };
        return evaluation;
    }

    const std::vector<double> scores = extractScores(results);
    const double bestScore = *std::max_element(scores.begin(), scores.end());
    const double avgTop3 = averageTopN(scores, 3);

    evaluation.bestScore = bestScore;
    evaluation.avgTop3Score = avgTop3;
    evaluation.resultCount = static_cast<int>(results.size());
    evaluation.evidenceLevel = classify(bestScore, avgTop3);
    evaluation.gatePassed = bestScore >= m_config.minBestScore()
        && avgTop3 >= m_config.minAvgTop3Score();
    evaluation.reasons = buildReasons(bestScore, avgTop3, evaluation.gatePassed);
    evaluation.recommendedActions = recommendedActions(evaluation.evidenceLevel, bestScore);
    return evaluation;
}

EvidenceLevel EvidenceGate::classify(double bestScore, double avgTop3Score) const
{
    if (bestScore >= m_config.strongBestThreshold()
        && avgTop3Score >= m_config.strongAvgThreshold()) {
        return EvidenceLevel::Strong;
    }
    if (bestScore >= m_config.minBestScore() && avgTop3Score >= m_config.minAvgTop3Score()) {
        return EvidenceLevel::Moderate;
    }
    if (bestScore > 0.0 || avgTop3Score > 0.0) {
        return EvidenceLevel::Low;
    }
    return EvidenceLevel::Insufficient;
}

double EvidenceGate::averageTopN(std::vector<double> scores, int n)
{
    if (scores.empty() || n <= 0) {
        return 0.0;
    }
    std::sort(scores.begin(), scores.end(), std::greater<double>());
    const size_t count = std::min(scores.size(), static_cast<size_t>(n));
    const double sum = std::accumulate(scores.begin(),
                                       scores.begin() + static_cast<std::ptrdiff_t>(count), 0.0);
    return sum / static_cast<double>(count);
}

QStringList EvidenceGate::buildReasons(double bestScore, double avgTop3Score, bool gatePassed) const
{
    QStringList reasons;
    reasons << QStringLiteral("best_score=%1 (threshold=%2)")
                   .arg(bestScore, 0, 'f', 3)
                   .arg(m_config.minBestScore(), 0, 'f', 2);
    reasons << QStringLiteral("avg_top3=%1 (threshold=%2)")
                   .arg(avgTop3Score, 0, 'f', 3)
                   .arg(m_config.minAvgTop3Score(), 0, 'f', 2);

    if (bestScore < m_config.minBestScore()) {
        reasons << QStringLiteral("Best score below minimum threshold");
    }
    if (avgTop3Score < m_config.minAvgTop3Score()) {
        reasons << QStringLiteral("Average score below minimum threshold");
    }
    if (gatePassed) {
        reasons << QStringLiteral("Gate passed: evidence quality acceptable");
    }
    return reasons;
}

QStringList EvidenceGate::recommendedActions(EvidenceLevel level, double bestScore) const
{
    if (level == EvidenceLevel::Strong) {
        return {};
    }
    if (level == EvidenceLevel::Moderate) {
        return {QLatin1String(kStrategyExpandTopK)};
    }

    QStringList actions;
    if (m_config.multiQueryEnabled()) {
        actions << QLatin1String(kStrategyMultiQuery);
    }
    // Very weak semantic evidence is where a hypothetical document helps most.
    if (m_config.hydeEnabled() && bestScore < m_config.minBestScore() * 0.5) {
        actions << QLatin1String(kStrategyHyde);
    }
    actions << QLatin1String(kStrategyAggressiveHybrid);

    if (level == EvidenceLevel::Insufficient) {
        actions << QLatin1String(kStrategyExpandSources);
        if (m_config.hydeEnabled() && !actions.contains(QLatin1String(kStrategyHyde))) {
            actions << QLatin1String(kStrategyHyde);
        }
    }
    return actions;
}

} // namespace cr

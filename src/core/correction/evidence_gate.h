#pragma once

#include "core/shared/retrieval_result.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace cr {

// Corrective strategy names, shared by recommendations, retry parameters and
// the audit trail.
inline constexpr char kStrategyExpandTopK[] = "expand_top_k";
inline constexpr char kStrategyAggressiveHybrid[] = "aggressive_hybrid";
inline constexpr char kStrategyMultiQuery[] = "multi_query";
inline constexpr char kStrategyHyde[] = "hyde";
inline constexpr char kStrategyAggressiveMultiQuery[] = "aggressive_multi_query";
inline constexpr char kStrategyExpandSources[] = "expand_sources";

// Ordered by decreasing confidence.
enum class EvidenceLevel {
    Strong,
    Moderate,
    Low,
    Insufficient,
};

QString evidenceLevelToString(EvidenceLevel level);
std::optional<EvidenceLevel> evidenceLevelFromString(const QString& value);
double evidenceConfidence(EvidenceLevel level);
bool requiresCorrection(EvidenceLevel level);
bool isAcceptable(EvidenceLevel level);

struct GateConfigValues {
    double minBestScore = 0.5;
    double minAvgTop3Score = 0.35;
    double strongBestThreshold = 0.70;
    double strongAvgThreshold = 0.55;
    int maxRetryRounds = 2;
    bool multiQueryEnabled = true;
    bool hydeEnabled = true;
    int multiQueryFanout = 3;
    double aggressiveTopKMultiplier = 2.0;
    double aggressiveLexicalWeight = 0.45;
    double aggressiveSemanticWeight = 0.55;
};

// Unset fields keep the base configuration's value.
struct GateConfigOverrides {
    std::optional<double> minBestScore;
    std::optional<double> minAvgTop3Score;
    std::optional<double> strongBestThreshold;
    std::optional<double> strongAvgThreshold;
    std::optional<int> maxRetryRounds;
    std::optional<bool> multiQueryEnabled;
    std::optional<bool> hydeEnabled;
    std::optional<int> multiQueryFanout;
    std::optional<double> aggressiveTopKMultiplier;
    std::optional<double> aggressiveLexicalWeight;
    std::optional<double> aggressiveSemanticWeight;

    bool isEmpty() const;
};

// Validated, read-only gate thresholds and strategy switches. Construction
// throws std::invalid_argument for malformed values.
class GateConfig {
public:
    GateConfig();
    explicit GateConfig(const GateConfigValues& values);

    GateConfig withOverrides(const GateConfigOverrides& overrides) const;

    const GateConfigValues& values() const { return m_values; }

    double minBestScore() const { return m_values.minBestScore; }
    double minAvgTop3Score() const { return m_values.minAvgTop3Score; }
    double strongBestThreshold() const { return m_values.strongBestThreshold; }
    double strongAvgThreshold() const { return m_values.strongAvgThreshold; }
    int maxRetryRounds() const { return m_values.maxRetryRounds; }
    bool multiQueryEnabled() const { return m_values.multiQueryEnabled; }
    bool hydeEnabled() const { return m_values.hydeEnabled; }
    int multiQueryFanout() const { return m_values.multiQueryFanout; }
    double aggressiveTopKMultiplier() const { return m_values.aggressiveTopKMultiplier; }
    double aggressiveLexicalWeight() const { return m_values.aggressiveLexicalWeight; }
    double aggressiveSemanticWeight() const { return m_values.aggressiveSemanticWeight; }

private:
    static void validate(const GateConfigValues& values);

    GateConfigValues m_values;
};

struct GateEvaluation {
    bool gatePassed = false;
    EvidenceLevel evidenceLevel = EvidenceLevel::Insufficient;
    double bestScore = 0.0;
    double avgTop3Score = 0.0;
    int resultCount = 0;
    QStringList reasons;
    QStringList recommendedActions;

    double confidence() const { return evidenceConfidence(evidenceLevel); }

    // Reasons joined with "; ".
    QString reason() const;
    QString toString() const;

    // Scores rounded to 4 decimals.
    QJsonObject toJson() const;
};

// Classifies a scored result list against the gate thresholds. Pure and
// never fails: malformed or missing scores count as 0.
class EvidenceGate {
public:
    explicit EvidenceGate(GateConfig config = GateConfig());

    GateEvaluation evaluate(const ResultList& results) const;

    EvidenceLevel classify(double bestScore, double avgTop3Score) const;

    const GateConfig& config() const { return m_config; }

private:
    static double averageTopN(std::vector<double> scores, int n);
    QStringList buildReasons(double bestScore, double avgTop3Score, bool gatePassed) const;
    QStringList recommendedActions(EvidenceLevel level, double bestScore) const;

    GateConfig m_config;
};

} // namespace cr

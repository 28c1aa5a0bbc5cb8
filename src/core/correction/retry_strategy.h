#pragma once

#include "core/correction/evidence_gate.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace cr {

// Upper bound on search breadth for any corrective attempt.
constexpr int kMaxRetryTopK = 50;

struct RetryParameters {
    int topK = 10;
    double lexicalWeight = 0.5;
    double semanticWeight = 0.5;
    bool useMultiQuery = false;
    int multiQueryCount = 0;
    bool useHyde = false;
    QString strategyName;

    QJsonObject toJson() const;
    static std::optional<RetryParameters> fromJson(const QJsonObject& json);
};

// Lightweight per-round hint, for callers that tune their own search call.
struct RetryAdjustments {
    bool useHyde = false;
    bool useMultiQuery = false;
    double topKMultiplier = 1.0;
    double lexicalWeight = 0.5;
    double semanticWeight = 0.5;

    QJsonObject toJson() const;
};

// Produces the ordered corrective strategies for an evidence level.
//
// Low/Insufficient order is cheapest first: aggressive hybrid, multi-query,
// HyDE, then combined aggressive multi-query (Insufficient only). The list is
// truncated to maxRetryRounds.
class RetryStrategyBuilder {
public:
    explicit RetryStrategyBuilder(GateConfig config, int baseTopK = 10);

    std::vector<RetryParameters> buildStrategies(EvidenceLevel level,
                                                 bool alreadyTriedMultiQuery = false,
                                                 bool alreadyTriedHyde = false) const;

    // round 0 -> aggressive, round 1 -> multi-query, round >= 2 -> HyDE.
    RetryAdjustments suggestAdjustments(EvidenceLevel level, int round = 0) const;

    int baseTopK() const { return m_baseTopK; }

private:
    int scaledTopK(double multiplier) const;

    GateConfig m_config;
    int m_baseTopK;
};

} // namespace cr

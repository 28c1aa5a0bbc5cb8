#pragma once

#include "core/correction/evidence_gate.h"
#include "core/correction/retry_strategy.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace cr {

// Serialized queries are cut to this many characters.
constexpr int kAuditQueryMaxChars = 200;

struct CorrectiveAction {
    QString strategy;
    bool success = false;
    int64_t durationMs = 0;
    int resultCount = 0;
    double bestScore = 0.0;
    double avgTop3Score = 0.0;
    RetryParameters parameters;
    std::optional<QString> error;

    QJsonObject toJson() const;
};

// Record of one correction request: the initial evaluation, every attempted
// action in order, and the final outcome. Append-only until finalize(), then
// read-only.
class AuditTrail {
public:
    AuditTrail(QString query, GateEvaluation initialEvaluation);

    // Returns false (and drops the action) once the trail is finalized.
    bool addAction(CorrectiveAction action);

    // Returns false if already finalized.
    bool finalize(GateEvaluation finalEvaluation, int64_t totalDurationMs, int finalResultCount);

    const QString& query() const { return m_query; }
    const GateEvaluation& initialEvaluation() const { return m_initialEvaluation; }
    const std::vector<CorrectiveAction>& actions() const { return m_actions; }
    const std::optional<GateEvaluation>& finalEvaluation() const { return m_finalEvaluation; }
    int64_t totalDurationMs() const { return m_totalDurationMs; }
    int finalResultCount() const { return m_finalResultCount; }
    bool isFinalized() const { return m_finalized; }

    bool correctionAttempted() const { return !m_actions.empty(); }

    // Final evaluation passes where the initial one failed.
    bool correctionSuccessful() const;

    QJsonObject toJson() const;
    void logSummary() const;

private:
    QString m_query;
    GateEvaluation m_initialEvaluation;
    std::vector<CorrectiveAction> m_actions;
    std::optional<GateEvaluation> m_finalEvaluation;
    int64_t m_totalDurationMs = 0;
    int m_finalResultCount = 0;
    bool m_finalized = false;
};

} // namespace cr

#pragma once

#include "core/correction/audit_trail.h"
#include "core/correction/evidence_gate.h"
#include "core/correction/retry_strategy.h"
#include "core/shared/retrieval_result.h"

#include <QString>

#include <cstdint>
#include <optional>

namespace cr {

// Decision half of the correction loop: evaluates result sets, decides when
// another round is worthwhile and which parameters it should use, and keeps
// the audit trail. Holds no per-request state, so one instance can serve
// concurrent requests.
class CorrectionOrchestrator {
public:
    explicit CorrectionOrchestrator(GateConfig config = GateConfig());

    GateEvaluation evaluateResults(const ResultList& results) const;

    // False once the gate passed, the round cap is reached, or an empty
    // result set has already been retried once.
    bool shouldRetry(const GateEvaluation& evaluation, int round) const;

    // Strategy for this round, or nullopt when shouldRetry() says stop or the
    // strategies are exhausted.
    std::optional<RetryParameters> retryParameters(const GateEvaluation& evaluation,
                                                   int baseTopK,
                                                   bool alreadyTriedMultiQuery,
                                                   bool alreadyTriedHyde,
                                                   int round) const;

    AuditTrail createAuditTrail(const QString& query, const ResultList& initialResults) const;

    // Evaluates the attempt's results, appends the action to the trail and
    // returns the fresh evaluation.
    GateEvaluation recordAction(AuditTrail& trail,
                                const QString& strategyName,
                                const ResultList& results,
                                int64_t durationMs,
                                const RetryParameters& parameters,
                                const std::optional<QString>& error = std::nullopt) const;

    const GateConfig& config() const { return m_config; }
    const EvidenceGate& gate() const { return m_gate; }

private:
    GateConfig m_config;
    EvidenceGate m_gate;
};

} // namespace cr

#include "core/correction/correction_orchestrator.h"
#include "core/shared/logging.h"

namespace cr {

CorrectionOrchestrator::CorrectionOrchestrator(GateConfig config)
    : m_config(std::move(config))
    , m_gate(m_config)
{
}

GateEvaluation CorrectionOrchestrator::evaluateResults(const ResultList& results) const
{
    return m_gate.evaluate(results);
}

bool CorrectionOrchestrator::shouldRetry(const GateEvaluation& evaluation, int round) const
{
    if (evaluation.gatePassed) {
        return false;
    }
    if (round >= m_config.maxRetryRounds()) {
        LOG_DEBUG(crCorrection, "Retry cap reached (%d rounds)", m_config.maxRetryRounds());
        return false;
    }
    if (evaluation.resultCount == 0 && round > 0) {
        return false;
    }
    return requiresCorrection(evaluation.evidenceLevel);
}

std::optional<RetryParameters> CorrectionOrchestrator::retryParameters(
    const GateEvaluation& evaluation,
    int baseTopK,
    bool alreadyTriedMultiQuery,
    bool alreadyTriedHyde,
    int round) const
{
    if (round < 0 || !shouldRetry(evaluation, round)) {
        return std::nullopt;
    }

    const RetryStrategyBuilder builder(m_config, baseTopK);
    const std::vector<RetryParameters> strategies = builder.buildStrategies(
        evaluation.evidenceLevel, alreadyTriedMultiQuery, alreadyTriedHyde);

    if (static_cast<size_t>(round) >= strategies.size()) {
        LOG_DEBUG(crCorrection, "No strategy left for round %d (level=%s)", round,
                  qUtf8Printable(evidenceLevelToString(evaluation.evidenceLevel)));
        return std::nullopt;
    }
    return strategies[static_cast<size_t>(round)];
}

AuditTrail CorrectionOrchestrator::createAuditTrail(const QString& query,
                                                    const ResultList& initialResults) const
{
    return AuditTrail(query, m_gate.evaluate(initialResults));
}

GateEvaluation CorrectionOrchestrator::recordAction(AuditTrail& trail,
                                                    const QString& strategyName,
                                                    const ResultList& results,
                                                    int64_t durationMs,
                                                    const RetryParameters& parameters,
                                                    const std::optional<QString>& error) const
{
    GateEvaluation evaluation = m_gate.evaluate(results);

    CorrectiveAction action;
    action.strategy = strategyName;
    // An attempt only counts as a success when its evidence clears the gate.
    action.success = !error.has_value() && evaluation.gatePassed;
    action.durationMs = durationMs;
    action.resultCount = static_cast<int>(results.size());
    action.bestScore = evaluation.bestScore;
    action.avgTop3Score = evaluation.avgTop3Score;
    action.parameters = parameters;
    action.error = error;
    trail.addAction(std::move(action));

    return evaluation;
}

} // namespace cr

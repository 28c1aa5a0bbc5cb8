#include "core/correction/gate_api.h"

namespace {

cr::GateConfig resolveConfig(const cr::GateConfigOverrides& overrides, const cr::GateConfig& base)
{
    return overrides.isEmpty() ? base : base.withOverrides(overrides);
}

} // namespace

namespace cr {

QJsonObject evaluateGate(const ResultList& results,
                         const GateConfigOverrides& overrides,
                         const GateConfig& base)
{
    const EvidenceGate gate(resolveConfig(overrides, base));
    const GateEvaluation evaluation = gate.evaluate(results);

    QJsonObject json = evaluation.toJson();
    json[QStringLiteral("safeMode")] = !evaluation.gatePassed;
    return json;
}

std::optional<QJsonObject> getRetryStrategy(const ResultList& results,
                                            int baseTopK,
                                            bool alreadyTriedMultiQuery,
                                            bool alreadyTriedHyde,
                                            const GateConfigOverrides& overrides,
                                            const GateConfig& base)
{
    const CorrectionOrchestrator orchestrator(resolveConfig(overrides, base));
    const GateEvaluation evaluation = orchestrator.evaluateResults(results);
    const std::optional<RetryParameters> params = orchestrator.retryParameters(
        evaluation, baseTopK, alreadyTriedMultiQuery, alreadyTriedHyde, 0);
    if (!params) {
        return std::nullopt;
    }
    return params->toJson();
}

CorrectionOrchestrator createOrchestrator(const GateConfigOverrides& overrides,
                                          const GateConfig& base)
{
    return CorrectionOrchestrator(resolveConfig(overrides, base));
}

} // namespace cr

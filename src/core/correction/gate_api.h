#pragma once

#include "core/correction/correction_orchestrator.h"
#include "core/correction/evidence_gate.h"
#include "core/shared/retrieval_result.h"

#include <QJsonObject>

#include <optional>

namespace cr {

// Single-shot helpers for callers that only need a verdict or want to drive
// their own retry loop. Overrides are applied on top of base; invalid
// overrides throw std::invalid_argument.

// GateEvaluation::toJson() plus safeMode (true when the gate failed).
QJsonObject evaluateGate(const ResultList& results,
                         const GateConfigOverrides& overrides = {},
                         const GateConfig& base = GateConfig());

// First strategy for the current evidence, or nullopt when none applies.
std::optional<QJsonObject> getRetryStrategy(const ResultList& results,
                                            int baseTopK = 10,
                                            bool alreadyTriedMultiQuery = false,
                                            bool alreadyTriedHyde = false,
                                            const GateConfigOverrides& overrides = {},
                                            const GateConfig& base = GateConfig());

CorrectionOrchestrator createOrchestrator(const GateConfigOverrides& overrides = {},
                                          const GateConfig& base = GateConfig());

} // namespace cr

#pragma once

#include "core/correction/evidence_gate.h"
#include "core/fusion/rank_fusion.h"
#include "core/resilience/circuit_breaker.h"
#include "core/resilience/retry_policy.h"

#include <QString>

namespace cr {

struct CorrectionSettings {
    // Gate thresholds and strategy switches
    GateConfigValues gate;

    // Fault tolerance, applied to every upstream dependency
    CircuitBreakerConfig breaker;
    RetryConfig retry;

    // Breaker names, shared by every request using the same registry
    QString searchBreakerName = QStringLiteral("search");
    QString multiQueryBreakerName = QStringLiteral("multi-query");
    QString hydeBreakerName = QStringLiteral("hyde-generator");

    // Multi-query fusion
    int rrfK = kDefaultRrfK;
};

} // namespace cr

#pragma once

#include "core/correction/audit_trail.h"
#include "core/correction/correction_orchestrator.h"
#include "core/correction/retrieval_callbacks.h"
#include "core/resilience/circuit_breaker_registry.h"
#include "core/resilience/resilient_endpoint.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cr {

struct CorrectionOutcome {
    ResultList results;
    AuditTrail auditTrail;
};

// The corrective retrieval loop. Runs strategies round by round until the
// gate passes, strategies run out, or the round cap is hit. Every upstream
// call goes through a named breaker from the injected registry plus the
// configured retry policy.
//
// A failed strategy never aborts the loop: its error is recorded on the
// audit trail and the next round proceeds. The only error raised is
// MissingCapabilityError when correction is needed and no search callback
// exists. Instances hold no per-request state.
class CorrectiveSearch {
public:
    CorrectiveSearch(RetrievalCallbacks callbacks,
                     CircuitBreakerRegistry& registry,
                     const CorrectionSettings& settings = CorrectionSettings());

    CorrectionOutcome searchWithCorrection(const QString& query,
                                           const ResultList& initialResults,
                                           int baseTopK = 10,
                                           const QJsonObject& extra = QJsonObject());

    const CorrectionOrchestrator& orchestrator() const { return m_orchestrator; }

    // name -> ResilientEndpoint::healthStatus() for each upstream dependency.
    QJsonObject healthStatus() const;

private:
    struct AttemptResult {
        ResultList results;
        std::optional<QString> error;
    };

    AttemptResult runStrategy(const QString& query,
                              const RetryParameters& params,
                              const QJsonObject& extra);
    AttemptResult runMultiQuery(const QString& query,
                                const RetryParameters& params,
                                const QJsonObject& extra);
    AttemptResult runHyde(const QString& query,
                          const RetryParameters& params,
                          const QJsonObject& extra);

    CallResult<ResultList> resilientSearch(const SearchRequest& request);
    ResultList invokeSearch(const SearchRequest& request) const;

    RetrievalCallbacks m_callbacks;
    CorrectionSettings m_settings;
    CorrectionOrchestrator m_orchestrator;
    ResilientEndpoint m_searchEndpoint;
    ResilientEndpoint m_multiQueryEndpoint;
    ResilientEndpoint m_hydeEndpoint;
};

} // namespace cr

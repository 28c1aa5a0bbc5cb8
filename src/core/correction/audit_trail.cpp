#include "core/correction/audit_trail.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonValue>

#include <cmath>

namespace {

constexpr int kLogQueryChars = 80;

double roundTo4(double value)
{
    return std::round(value * 10000.0) / 10000.0;
}

QString strategyList(const std::vector<cr::CorrectiveAction>& actions)
{
    QStringList names;
    for (const cr::CorrectiveAction& action : actions) {
        names << action.strategy;
    }
    return QStringLiteral("[") + names.join(QStringLiteral(", ")) + QStringLiteral("]");
}

} // namespace

namespace cr {

QJsonObject CorrectiveAction::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("strategy")] = strategy;
    json[QStringLiteral("success")] = success;
    json[QStringLiteral("durationMs")] = static_cast<qint64>(durationMs);
    json[QStringLiteral("resultCount")] = resultCount;
    json[QStringLiteral("bestScore")] = roundTo4(bestScore);
    json[QStringLiteral("avgTop3Score")] = roundTo4(avgTop3Score);
    json[QStringLiteral("parameters")] = parameters.toJson();
    json[QStringLiteral("error")] = error.has_value() ? QJsonValue(*error)
                                                      : QJsonValue(QJsonValue::Null);
    return json;
}

AuditTrail::AuditTrail(QString query, GateEvaluation initialEvaluation)
    : m_query(std::move(query))
    , m_initialEvaluation(std::move(initialEvaluation))
{
}

bool AuditTrail::addAction(CorrectiveAction action)
{
    if (m_finalized) {
        LOG_WARN(crCorrection, "Ignoring action '%s' on a finalized audit trail",
                 qUtf8Printable(action.strategy));
        return false;
    }
    m_actions.push_back(std::move(action));
    return true;
}

bool AuditTrail::finalize(GateEvaluation finalEvaluation, int64_t totalDurationMs,
                          int finalResultCount)
{
    if (m_finalized) {
        LOG_WARN(crCorrection, "Audit trail already finalized");
        return false;
    }
    m_finalEvaluation = std::move(finalEvaluation);
    m_totalDurationMs = totalDurationMs;
    m_finalResultCount = finalResultCount;
    m_finalized = true;
    return true;
}

bool AuditTrail::correctionSuccessful() const
{
    return m_finalEvaluation.has_value()
        && m_finalEvaluation->gatePassed
        && !m_initialEvaluation.gatePassed;
}

QJsonObject AuditTrail::toJson() const
{
    QJsonArray actions;
    for (const CorrectiveAction& action : m_actions) {
        actions.append(action.toJson());
    }

    QJsonObject json;
    json[QStringLiteral("query")] = m_query.left(kAuditQueryMaxChars);
    json[QStringLiteral("initialEvaluation")] = m_initialEvaluation.toJson();
    json[QStringLiteral("actions")] = actions;
    json[QStringLiteral("finalEvaluation")] = m_finalEvaluation.has_value()
        ? QJsonValue(m_finalEvaluation->toJson())
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("totalDurationMs")] = static_cast<qint64>(m_totalDurationMs);
    json[QStringLiteral("finalResultCount")] = m_finalResultCount;
    json[QStringLiteral("correctionAttempted")] = correctionAttempted();
    json[QStringLiteral("correctionSuccessful")] = correctionSuccessful();
    return json;
}

void AuditTrail::logSummary() const
{
    const QString query = m_query.left(kLogQueryChars);
    const QString finalLevel = m_finalEvaluation.has_value()
        ? evidenceLevelToString(m_finalEvaluation->evidenceLevel)
        : QStringLiteral("unknown");

    if (!correctionAttempted()) {
        LOG_DEBUG(crCorrection,
                  "Gate passed without correction: query=%s level=%s best=%.3f avg=%.3f",
                  qUtf8Printable(query),
                  qUtf8Printable(evidenceLevelToString(m_initialEvaluation.evidenceLevel)),
                  m_initialEvaluation.bestScore, m_initialEvaluation.avgTop3Score);
        return;
    }

    if (correctionSuccessful()) {
        LOG_INFO(crCorrection,
                 "Correction successful: query=%s initial_level=%s final_level=%s "
                 "actions=%s duration_ms=%lld",
                 qUtf8Printable(query),
                 qUtf8Printable(evidenceLevelToString(m_initialEvaluation.evidenceLevel)),
                 qUtf8Printable(finalLevel),
                 qUtf8Printable(strategyList(m_actions)),
                 static_cast<long long>(m_totalDurationMs));
    } else {
        LOG_WARN(crCorrection,
                 "Correction unsuccessful: query=%s level=%s actions=%s duration_ms=%lld",
                 qUtf8Printable(query),
                 qUtf8Printable(finalLevel),
                 qUtf8Printable(strategyList(m_actions)),
                 static_cast<long long>(m_totalDurationMs));
    }
}

} // namespace cr

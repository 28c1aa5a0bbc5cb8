#pragma once

#include "core/resilience/async_retry.h"
#include "core/resilience/circuit_breaker.h"
#include "core/resilience/resilient_call.h"

#include <QObject>
#include <QString>
#include <QVariant>

#include <memory>

namespace cr {

// Non-blocking counterpart of executeWithResilience. start() consults the
// breaker, then drives the attempts through an AsyncRetryOperation and
// records the final outcome on the breaker. finished() fires exactly once,
// always from the event loop, never from inside start().
//
// An invalid fallback QVariant means "no fallback": a rejected or exhausted
// call then finishes with an invalid value and the error text.
class AsyncResilientCall : public QObject {
    Q_OBJECT
public:
    AsyncResilientCall(std::shared_ptr<CircuitBreaker> breaker,
                       RetryConfig config,
                       AsyncRetryOperation::Attempt attempt,
                       QVariant fallback = QVariant(),
                       QObject* parent = nullptr);

    void start();

    bool isFinished() const { return m_finished; }
    CallStatus status() const { return m_status; }
    const QVariant& value() const { return m_value; }
    const QString& error() const { return m_error; }
    bool usedFallback() const
    {
        return m_finished && m_status != CallStatus::Success && m_value.isValid();
    }

signals:
    void attemptFailed(int attempt, const QString& error, double delayMs);
    void finished(bool ok, const QVariant& value, const QString& error);

private:
    void onRetrySucceeded(const QVariant& value);
    void onRetryFailed(const QString& error);
    void finish(CallStatus status, QVariant value, QString error);

    std::shared_ptr<CircuitBreaker> m_breaker;
    RetryConfig m_config;
    AsyncRetryOperation::Attempt m_attempt;
    QVariant m_fallback;
    AsyncRetryOperation* m_operation = nullptr;

    CallStatus m_status = CallStatus::Failed;
    QVariant m_value;
    QString m_error;
    bool m_started = false;
    bool m_finished = false;
};

} // namespace cr

#include "core/resilience/async_resilient_call.h"
#include "core/shared/logging.h"

#include <QTimer>

namespace cr {

AsyncResilientCall::AsyncResilientCall(std::shared_ptr<CircuitBreaker> breaker,
                                       RetryConfig config,
                                       AsyncRetryOperation::Attempt attempt,
                                       QVariant fallback,
                                       QObject* parent)
    : QObject(parent)
    , m_breaker(std::move(breaker))
    , m_config(std::move(config))
    , m_attempt(std::move(attempt))
    , m_fallback(std::move(fallback))
{
}

void AsyncResilientCall::start()
{
    if (m_started) {
        LOG_WARN(crResilience, "Async call on '%s' already started",
                 qUtf8Printable(m_breaker->name()));
        return;
    }
    m_started = true;

    if (!m_breaker->allowRequest()) {
        const QString error = QStringLiteral("circuit open: %1").arg(m_breaker->name());
        if (m_fallback.isValid()) {
            LOG_WARN(crResilience, "Circuit open for '%s', returning fallback",
                     qUtf8Printable(m_breaker->name()));
        }
        QTimer::singleShot(0, this, [this, error]() {
            finish(CallStatus::Rejected, m_fallback, error);
        });
        return;
    }

    m_operation = new AsyncRetryOperation(m_config, m_attempt, m_breaker->name(), this);
    connect(m_operation, &AsyncRetryOperation::attemptFailed,
            this, &AsyncResilientCall::attemptFailed);
    connect(m_operation, &AsyncRetryOperation::succeeded,
            this, &AsyncResilientCall::onRetrySucceeded);
    connect(m_operation, &AsyncRetryOperation::failed,
            this, &AsyncResilientCall::onRetryFailed);
    m_operation->start();
}

void AsyncResilientCall::onRetrySucceeded(const QVariant& value)
{
    m_breaker->recordSuccess();
    finish(CallStatus::Success, value, QString());
}

void AsyncResilientCall::onRetryFailed(const QString& error)
{
    const std::exception_ptr cause = m_operation->lastException();
    if (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& failure) {
            m_breaker->recordFailure(failure);
        }
    } else {
        m_breaker->recordFailure();
    }

    if (m_fallback.isValid()) {
        LOG_WARN(crResilience, "All retries failed for '%s', returning fallback",
                 qUtf8Printable(m_breaker->name()));
    }
    finish(CallStatus::Failed, m_fallback, error);
}

void AsyncResilientCall::finish(CallStatus status, QVariant value, QString error)
{
    m_status = status;
    m_value = std::move(value);
    m_error = std::move(error);
    m_finished = true;
    emit finished(status == CallStatus::Success, m_value, m_error);
}

} // namespace cr

#include "core/resilience/async_retry.h"
#include "core/shared/logging.h"

#include <QTimer>

#include <cmath>

namespace cr {

AsyncRetryOperation::AsyncRetryOperation(RetryConfig config, Attempt attempt, QString label,
                                         QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_attempt(std::move(attempt))
    , m_label(std::move(label))
{
}

void AsyncRetryOperation::start()
{
    if (m_running || m_finished) {
        LOG_WARN(crResilience, "Async retry '%s' already started", qUtf8Printable(m_label));
        return;
    }
    m_running = true;
    QTimer::singleShot(0, this, [this]() { runAttempt(); });
}

void AsyncRetryOperation::runAttempt()
{
    const int attempts = m_config.maxAttempts > 0 ? m_config.maxAttempts : 1;
    const int attempt = m_attemptsMade++;

    QVariant value;
    QString errorText;
    bool ok = false;
    bool retry = false;
    try {
        value = m_attempt();
        ok = true;
        m_lastException = nullptr;
    } catch (const std::exception& error) {
        m_lastException = std::current_exception();
        errorText = QString::fromUtf8(error.what());
        retry = attempt + 1 < attempts && m_config.shouldRetry(error);
    }

    if (ok) {
        m_running = false;
        m_finished = true;
        emit succeeded(value);
        return;
    }

    if (!retry) {
        m_running = false;
        m_finished = true;
        LOG_WARN(crResilience, "Async retry '%s' gave up after %d attempt(s): %s",
                 qUtf8Printable(m_label), m_attemptsMade, qUtf8Printable(errorText));
        emit failed(errorText);
        return;
    }

    const double delayMs = backoffDelayMs(attempt, m_config);
    LOG_WARN(crResilience, "Async retry %d/%d for '%s': %s. Waiting %.0fms",
             attempt + 1, attempts, qUtf8Printable(m_label), qUtf8Printable(errorText), delayMs);
    emit attemptFailed(attempt, errorText, delayMs);
    QTimer::singleShot(static_cast<int>(std::lround(delayMs)), this, [this]() { runAttempt(); });
}

} // namespace cr

#include "core/resilience/circuit_breaker.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonValue>

#include <stdexcept>

namespace {

QJsonValue optionalTime(const std::optional<qint64>& value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

} // namespace

namespace cr {

QString circuitStateToString(CircuitState state)
{
    switch (state) {
    case CircuitState::Closed:
        return QStringLiteral("closed");
    case CircuitState::Open:
        return QStringLiteral("open");
    case CircuitState::HalfOpen:
        return QStringLiteral("half_open");
    }
    return QStringLiteral("unknown");
}

void CircuitBreakerConfig::validate() const
{
    if (failureThreshold < 1) {
        throw std::invalid_argument("CircuitBreakerConfig.failureThreshold must be >= 1");
    }
    if (recoveryTimeoutMs < 0) {
        throw std::invalid_argument("CircuitBreakerConfig.recoveryTimeoutMs must be >= 0");
    }
    if (halfOpenMaxCalls < 1) {
        throw std::invalid_argument("CircuitBreakerConfig.halfOpenMaxCalls must be >= 1");
    }
}

QJsonObject CircuitBreakerStats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("state")] = circuitStateToString(state);
    json[QStringLiteral("failureCount")] = failureCount;
    json[QStringLiteral("successCount")] = successCount;
    json[QStringLiteral("lastFailureTime")] = optionalTime(lastFailureTimeMs);
    json[QStringLiteral("lastSuccessTime")] = optionalTime(lastSuccessTimeMs);
    json[QStringLiteral("lastStateChange")] = optionalTime(lastStateChangeMs);
    json[QStringLiteral("totalCalls")] = static_cast<qint64>(totalCalls);
    json[QStringLiteral("totalFailures")] = static_cast<qint64>(totalFailures);
    json[QStringLiteral("totalSuccesses")] = static_cast<qint64>(totalSuccesses);
    json[QStringLiteral("totalRejected")] = static_cast<qint64>(totalRejected);
    return json;
}

CircuitBreaker::CircuitBreaker(QString name, CircuitBreakerConfig config, Clock clock)
    : m_name(std::move(name))
    , m_config(std::move(config))
    , m_clock(std::move(clock))
{
    m_config.validate();
    LOG_INFO(crResilience,
             "CircuitBreaker '%s' initialized: failureThreshold=%d recoveryTimeoutMs=%d",
             qUtf8Printable(m_name), m_config.failureThreshold, m_config.recoveryTimeoutMs);
}

qint64 CircuitBreaker::now() const
{
    return m_clock ? m_clock() : QDateTime::currentMSecsSinceEpoch();
}

CircuitState CircuitBreaker::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats.state;
}

CircuitBreakerStats CircuitBreaker::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

bool CircuitBreaker::isHealthy() const
{
    return state() != CircuitState::Open;
}

void CircuitBreaker::transitionTo(CircuitState next)
{
    const CircuitState previous = m_stats.state;
    if (previous == next) {
        return;
    }

    m_stats.state = next;
    m_stats.lastStateChangeMs = now();

    switch (next) {
    case CircuitState::Open:
        LOG_WARN(crResilience, "CircuitBreaker '%s': %s -> OPEN (failures=%d)",
                 qUtf8Printable(m_name),
                 qUtf8Printable(circuitStateToString(previous).toUpper()),
                 m_stats.failureCount);
        break;
    case CircuitState::HalfOpen:
        LOG_INFO(crResilience, "CircuitBreaker '%s': OPEN -> HALF_OPEN (testing recovery)",
                 qUtf8Printable(m_name));
        m_halfOpenCalls = 0;
        m_stats.successCount = 0;
        break;
    case CircuitState::Closed:
        LOG_INFO(crResilience, "CircuitBreaker '%s': %s -> CLOSED (service recovered)",
                 qUtf8Printable(m_name),
                 qUtf8Printable(circuitStateToString(previous).toUpper()));
        m_stats.failureCount = 0;
        m_stats.successCount = 0;
        break;
    }
}

bool CircuitBreaker::allowRequest()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (m_stats.state) {
    case CircuitState::Closed:
        return true;
    case CircuitState::Open: {
        const qint64 lastFailure = m_stats.lastFailureTimeMs.value_or(0);
        if (now() - lastFailure >= m_config.recoveryTimeoutMs) {
            transitionTo(CircuitState::HalfOpen);
            m_halfOpenCalls = 1;
            return true;
        }
        ++m_stats.totalRejected;
        return false;
    }
    case CircuitState::HalfOpen:
        if (m_halfOpenCalls < m_config.halfOpenMaxCalls) {
            ++m_halfOpenCalls;
            return true;
        }
        ++m_stats.totalRejected;
        return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    ++m_stats.totalCalls;
    ++m_stats.totalSuccesses;
    ++m_stats.successCount;
    m_stats.lastSuccessTimeMs = now();

    if (m_stats.state == CircuitState::HalfOpen) {
        if (m_stats.successCount >= m_config.halfOpenMaxCalls) {
            transitionTo(CircuitState::Closed);
        }
    } else if (m_stats.state == CircuitState::Closed) {
        m_stats.failureCount = 0;
    }
}

void CircuitBreaker::recordFailure()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    recordFailureLocked(QString());
}

void CircuitBreaker::recordFailure(const std::exception& error)
{
    if (m_config.isExcluded && m_config.isExcluded(error)) {
        LOG_DEBUG(crResilience, "CircuitBreaker '%s': excluded error: %s",
                  qUtf8Printable(m_name), error.what());
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    recordFailureLocked(QString::fromUtf8(error.what()));
}

void CircuitBreaker::recordFailureLocked(const QString& errorText)
{
    ++m_stats.totalCalls;
    ++m_stats.totalFailures;
    ++m_stats.failureCount;
    m_stats.lastFailureTimeMs = now();
    m_stats.successCount = 0;

    if (m_stats.state == CircuitState::HalfOpen) {
        transitionTo(CircuitState::Open);
    } else if (m_stats.state == CircuitState::Closed
               && m_stats.failureCount >= m_config.failureThreshold) {
        transitionTo(CircuitState::Open);
    }

    if (!errorText.isEmpty()) {
        LOG_WARN(crResilience, "CircuitBreaker '%s': failure recorded - %s",
                 qUtf8Printable(m_name), qUtf8Printable(errorText));
    }
}

void CircuitBreaker::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats = CircuitBreakerStats();
    m_halfOpenCalls = 0;
    LOG_INFO(crResilience, "CircuitBreaker '%s': reset to CLOSED", qUtf8Printable(m_name));
}

} // namespace cr

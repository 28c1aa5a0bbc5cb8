#include "core/resilience/resilient_endpoint.h"

namespace cr {

ResilientEndpoint::ResilientEndpoint(CircuitBreakerRegistry& registry,
                                     const QString& name,
                                     const CircuitBreakerConfig& breakerConfig,
                                     RetryConfig retryConfig)
    : m_breaker(registry.breaker(name, breakerConfig))
    , m_retryConfig(std::move(retryConfig))
{
    m_retryConfig.validate();
}

bool ResilientEndpoint::isHealthy() const
{
    return m_breaker->isHealthy();
}

CircuitState ResilientEndpoint::circuitState() const
{
    return m_breaker->state();
}

AsyncResilientCall* ResilientEndpoint::executeAsync(AsyncRetryOperation::Attempt attempt,
                                                    QVariant fallback,
                                                    QObject* parent)
{
    return new AsyncResilientCall(m_breaker, m_retryConfig, std::move(attempt),
                                  std::move(fallback), parent);
}

QJsonObject ResilientEndpoint::healthStatus() const
{
    QJsonObject status;
    status[QStringLiteral("name")] = m_breaker->name();
    status[QStringLiteral("healthy")] = isHealthy();
    status[QStringLiteral("circuitBreaker")] = m_breaker->stats().toJson();
    return status;
}

} // namespace cr

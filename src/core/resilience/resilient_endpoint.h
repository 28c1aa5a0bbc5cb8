#pragma once

#include "core/resilience/async_resilient_call.h"
#include "core/resilience/circuit_breaker_registry.h"
#include "core/resilience/resilient_call.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>
#include <utility>

namespace cr {

// An upstream dependency guarded by a named breaker from a registry and a
// retry policy. Endpoints with the same name share one breaker.
class ResilientEndpoint {
public:
    ResilientEndpoint(CircuitBreakerRegistry& registry,
                      const QString& name,
                      const CircuitBreakerConfig& breakerConfig = {},
                      RetryConfig retryConfig = {});

    const QString& name() const { return m_breaker->name(); }
    CircuitBreaker& breaker() { return *m_breaker; }
    const RetryConfig& retryConfig() const { return m_retryConfig; }

    bool isHealthy() const;
    CircuitState circuitState() const;

    // {name, healthy, circuitBreaker: stats}
    QJsonObject healthStatus() const;

    template <typename T, typename Fn>
    CallResult<T> execute(Fn&& fn, std::optional<T> fallback = std::nullopt)
    {
        return executeWithResilience<T>(*m_breaker, m_retryConfig, std::forward<Fn>(fn),
                                        std::move(fallback));
    }

    template <typename T, typename Fn>
    T executeOrThrow(Fn&& fn)
    {
        return callWithResilience<T>(*m_breaker, m_retryConfig, std::forward<Fn>(fn));
    }

    // Event-loop form of execute(). The returned call is owned by parent and
    // has not been started yet.
    AsyncResilientCall* executeAsync(AsyncRetryOperation::Attempt attempt,
                                     QVariant fallback = QVariant(),
                                     QObject* parent = nullptr);

private:
    std::shared_ptr<CircuitBreaker> m_breaker;
    RetryConfig m_retryConfig;
};

} // namespace cr

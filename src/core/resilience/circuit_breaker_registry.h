#pragma once

#include "core/resilience/circuit_breaker.h"

#include <QJsonObject>
#include <QString>

#include <map>
#include <memory>
#include <mutex>

namespace cr {

// Named breakers, one per upstream dependency. Components receive a registry
// explicitly; shared() exists for hosts that want a single process-wide one.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreaker::Clock clock = {});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    static CircuitBreakerRegistry& shared();

    // Get or create. The config only applies when the breaker is created.
    std::shared_ptr<CircuitBreaker> breaker(const QString& name,
                                            const CircuitBreakerConfig& config = {});

    bool contains(const QString& name) const;
    std::map<QString, std::shared_ptr<CircuitBreaker>> breakers() const;

    // name -> CircuitBreakerStats::toJson(), for health endpoints.
    QJsonObject statusJson() const;

    void resetAll();

private:
    CircuitBreaker::Clock m_clock;
    mutable std::mutex m_mutex;
    std::map<QString, std::shared_ptr<CircuitBreaker>> m_breakers;
};

} // namespace cr

#include "core/resilience/circuit_breaker_registry.h"
#include "core/shared/logging.h"

namespace cr {

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreaker::Clock clock)
    : m_clock(std::move(clock))
{
}

CircuitBreakerRegistry& CircuitBreakerRegistry::shared()
{
    static CircuitBreakerRegistry registry;
    return registry;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::breaker(const QString& name,
                                                                const CircuitBreakerConfig& config)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_breakers.find(name);
    if (it != m_breakers.end()) {
        return it->second;
    }
    auto created = std::make_shared<CircuitBreaker>(name, config, m_clock);
    m_breakers.emplace(name, created);
    return created;
}

bool CircuitBreakerRegistry::contains(const QString& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_breakers.find(name) != m_breakers.end();
}

std::map<QString, std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::breakers() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_breakers;
}

QJsonObject CircuitBreakerRegistry::statusJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QJsonObject status;
    for (const auto& [name, breaker] : m_breakers) {
        status.insert(name, breaker->stats().toJson());
    }
    return status;
}

void CircuitBreakerRegistry::resetAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [name, breaker] : m_breakers) {
        breaker->reset();
    }
    LOG_INFO(crResilience, "All %d circuit breakers reset", static_cast<int>(m_breakers.size()));
}

} // namespace cr

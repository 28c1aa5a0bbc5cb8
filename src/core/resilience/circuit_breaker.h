#pragma once

#include "core/resilience/resilience_errors.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace cr {

enum class CircuitState {
    Closed,     // calls flow through
    Open,       // calls rejected until the recovery timeout elapses
    HalfOpen,   // a bounded number of probe calls allowed
};

QString circuitStateToString(CircuitState state);

struct CircuitBreakerConfig {
    int failureThreshold = 5;
    int recoveryTimeoutMs = 60000;
    int halfOpenMaxCalls = 3;

    // Errors for which this returns true never count as failures.
    std::function<bool(const std::exception&)> isExcluded;

    // Throws std::invalid_argument naming the bad field.
    void validate() const;
};

struct CircuitBreakerStats {
    CircuitState state = CircuitState::Closed;
    int failureCount = 0;
    int successCount = 0;
    std::optional<qint64> lastFailureTimeMs;
    std::optional<qint64> lastSuccessTimeMs;
    std::optional<qint64> lastStateChangeMs;
    uint64_t totalCalls = 0;
    uint64_t totalFailures = 0;
    uint64_t totalSuccesses = 0;
    uint64_t totalRejected = 0;

    QJsonObject toJson() const;
};

// Per-dependency failure gate. Every read and transition of the state machine
// happens under one mutex, so concurrent callers see a single consistent state.
class CircuitBreaker {
public:
    // Milliseconds; defaults to wall-clock epoch time.
    using Clock = std::function<qint64()>;

    explicit CircuitBreaker(QString name, CircuitBreakerConfig config = {}, Clock clock = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    const QString& name() const { return m_name; }
    const CircuitBreakerConfig& config() const { return m_config; }

    CircuitState state() const;
    CircuitBreakerStats stats() const;
    bool isHealthy() const;

    // Open -> HalfOpen happens here, on the first call after the recovery
    // timeout. That call is the first of the half-open probes.
    bool allowRequest();

    void recordSuccess();
    void recordFailure();
    void recordFailure(const std::exception& error);

    void reset();

    // Decorator: rejects with CircuitOpenError, records the outcome of fn.
    template <typename Fn>
    auto wrap(Fn fn)
    {
        return [this, fn = std::move(fn)](auto&&... args) {
            if (!allowRequest()) {
                throw CircuitOpenError(m_name);
            }
            try {
                if constexpr (std::is_void_v<decltype(fn(std::forward<decltype(args)>(args)...))>) {
                    fn(std::forward<decltype(args)>(args)...);
                    recordSuccess();
                } else {
                    auto result = fn(std::forward<decltype(args)>(args)...);
                    recordSuccess();
                    return result;
                }
            } catch (const std::exception& error) {
                recordFailure(error);
                throw;
            }
        };
    }

private:
    void recordFailureLocked(const QString& errorText);
    void transitionTo(CircuitState next);
    qint64 now() const;

    QString m_name;
    CircuitBreakerConfig m_config;
    Clock m_clock;

    mutable std::mutex m_mutex;
    CircuitBreakerStats m_stats;
    int m_halfOpenCalls = 0;
};

} // namespace cr

#pragma once

#include "core/resilience/circuit_breaker.h"
#include "core/resilience/resilience_errors.h"
#include "core/resilience/retry_policy.h"
#include "core/shared/logging.h"

#include <QString>

#include <exception>
#include <optional>
#include <utility>

namespace cr {

enum class CallStatus {
    Success,    // the operation returned a value
    Rejected,   // the breaker was open, the operation never ran
    Failed,     // the operation ran and every attempt failed
};

QString callStatusToString(CallStatus status);

// Outcome of a breaker-guarded, retried call. On Rejected or Failed, value
// holds the caller's fallback when one was supplied.
template <typename T>
struct CallResult {
    CallStatus status = CallStatus::Failed;
    std::optional<T> value;
    QString error;
    std::exception_ptr exception;

    bool ok() const { return status == CallStatus::Success; }
    bool hasValue() const { return value.has_value(); }
    bool usedFallback() const { return !ok() && value.has_value(); }
};

// Checks the breaker, runs fn under the retry policy, then records the final
// outcome on the breaker. Never throws for errors raised by fn.
template <typename T, typename Fn>
CallResult<T> executeWithResilience(CircuitBreaker& breaker,
                                    const RetryConfig& retry,
                                    Fn&& fn,
                                    std::optional<T> fallback = std::nullopt)
{
    CallResult<T> result;
    if (!breaker.allowRequest()) {
        result.status = CallStatus::Rejected;
        result.error = QStringLiteral("circuit open: %1").arg(breaker.name());
        result.exception = std::make_exception_ptr(CircuitOpenError(breaker.name()));
        if (fallback.has_value()) {
            LOG_WARN(crResilience, "Circuit open for '%s', returning fallback",
                     qUtf8Printable(breaker.name()));
            result.value = std::move(fallback);
        }
        return result;
    }

    try {
        T value = retryWithBackoff(retry, std::forward<Fn>(fn), breaker.name());
        breaker.recordSuccess();
        result.status = CallStatus::Success;
        result.value = std::move(value);
        return result;
    } catch (const std::exception& error) {
        breaker.recordFailure(error);
        result.status = CallStatus::Failed;
        result.error = QString::fromUtf8(error.what());
        result.exception = std::current_exception();
    }

    if (fallback.has_value()) {
        LOG_WARN(crResilience, "All retries failed for '%s', returning fallback",
                 qUtf8Printable(breaker.name()));
        result.value = std::move(fallback);
    }
    return result;
}

// Throwing form: returns the value, throws CircuitOpenError when rejected,
// rethrows the last error when attempts are exhausted.
template <typename T, typename Fn>
T callWithResilience(CircuitBreaker& breaker, const RetryConfig& retry, Fn&& fn)
{
    CallResult<T> result = executeWithResilience<T>(breaker, retry, std::forward<Fn>(fn));
    if (result.ok()) {
        return std::move(*result.value);
    }
    std::rethrow_exception(result.exception);
}

} // namespace cr

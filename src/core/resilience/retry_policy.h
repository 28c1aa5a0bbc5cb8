#pragma once

#include "core/shared/logging.h"

#include <QString>

#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <utility>

namespace cr {

struct RetryConfig {
    int maxAttempts = 3;
    int baseDelayMs = 1000;
    int maxDelayMs = 30000;
    double exponentialBase = 2.0;
    bool jitter = true;

    // Null means every error is retryable except CircuitOpenError.
    std::function<bool(const std::exception&)> isRetryable;

    // Throws std::invalid_argument naming the bad field.
    void validate() const;

    bool shouldRetry(const std::exception& error) const;
};

// min(base * exponentialBase^attempt, maxDelay), plus up to 25% jitter when
// enabled. attempt is 0-indexed.
double backoffDelayMs(int attempt, const RetryConfig& config);

// Called before sleeping: (0-indexed attempt that failed, its error, delay).
using RetryObserver = std::function<void(int, const std::exception&, double)>;

// Runs fn up to maxAttempts times, sleeping between attempts but never after
// the last. The last error is rethrown once attempts are exhausted; an error
// that is not retryable is rethrown immediately.
template <typename Fn>
auto retryWithBackoff(const RetryConfig& config,
                      Fn&& fn,
                      const QString& label = QString(),
                      const RetryObserver& onRetry = RetryObserver()) -> decltype(fn())
{
    const int attempts = config.maxAttempts > 0 ? config.maxAttempts : 1;
    for (int attempt = 0;; ++attempt) {
        double delayMs = 0.0;
        try {
            return fn();
        } catch (const std::exception& error) {
            if (attempt + 1 >= attempts || !config.shouldRetry(error)) {
                throw;
            }
            delayMs = backoffDelayMs(attempt, config);
            if (onRetry) {
                onRetry(attempt, error, delayMs);
            } else {
                LOG_WARN(crResilience, "Retry %d/%d for '%s': %s. Waiting %.0fms",
                         attempt + 1, attempts, qUtf8Printable(label), error.what(), delayMs);
            }
        }
        std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(delayMs));
    }
}

// Decorator form of retryWithBackoff.
template <typename Fn>
auto withRetry(RetryConfig config, Fn fn, QString label = QString())
{
    return [config = std::move(config), fn = std::move(fn), label = std::move(label)](
               auto&&... args) {
        return retryWithBackoff(config, [&]() { return fn(args...); }, label);
    };
}

} // namespace cr

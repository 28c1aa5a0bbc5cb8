#include "core/resilience/retry_policy.h"
#include "core/resilience/resilience_errors.h"

#include <QRandomGenerator>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cr {

void RetryConfig::validate() const
{
    if (maxAttempts < 1) {
        throw std::invalid_argument("RetryConfig.maxAttempts must be >= 1");
    }
    if (baseDelayMs < 0) {
        throw std::invalid_argument("RetryConfig.baseDelayMs must be >= 0");
    }
    if (maxDelayMs < baseDelayMs) {
        throw std::invalid_argument("RetryConfig.maxDelayMs must be >= baseDelayMs");
    }
    if (!std::isfinite(exponentialBase) || exponentialBase < 1.0) {
        throw std::invalid_argument("RetryConfig.exponentialBase must be >= 1");
    }
}

bool RetryConfig::shouldRetry(const std::exception& error) const
{
    if (isRetryable) {
        return isRetryable(error);
    }
    return dynamic_cast<const CircuitOpenError*>(&error) == nullptr;
}

double backoffDelayMs(int attempt, const RetryConfig& config)
{
    const double exponent = static_cast<double>(std::max(attempt, 0));
    double delay = static_cast<double>(config.baseDelayMs) * std::pow(config.exponentialBase, exponent);
    delay = std::min(delay, static_cast<double>(config.maxDelayMs));

    if (config.jitter) {
        // Spread synchronized retries from many callers across 0-25% extra.
        delay += delay * QRandomGenerator::global()->bounded(0.25);
    }
    return delay;
}

} // namespace cr

#include <QtTest/QtTest>
#include "core/resilience/resilience_errors.h"
#include "core/resilience/retry_policy.h"

#include <stdexcept>
#include <vector>

namespace {

cr::RetryConfig fastConfig(int maxAttempts)
{
    cr::RetryConfig config;
    config.maxAttempts = maxAttempts;
    config.baseDelayMs = 1;
    config.maxDelayMs = 4;
    config.jitter = false;
    return config;
}

} // namespace

class TestRetryPolicy : public QObject {
    Q_OBJECT

private slots:
    void testBackoffDelayWithoutJitter();
    void testBackoffDelayMonotonicAndCapped();
    void testBackoffJitterBounded();
    void testSucceedsAfterTransientFailures();
    void testRethrowsLastErrorWhenExhausted();
    void testNoSleepAfterLastAttempt();
    void testNonRetryableErrorStopsImmediately();
    void testCircuitOpenIsNotRetriedByDefault();
    void testWithRetryDecorator();
    void testValidate();
};

void TestRetryPolicy::testBackoffDelayWithoutJitter()
{
    cr::RetryConfig config;
    config.baseDelayMs = 1000;
    config.maxDelayMs = 30000;
    config.exponentialBase = 2.0;
    config.jitter = false;

    QCOMPARE(cr::backoffDelayMs(0, config), 1000.0);
    QCOMPARE(cr::backoffDelayMs(1, config), 2000.0);
    QCOMPARE(cr::backoffDelayMs(3, config), 8000.0);
    QCOMPARE(cr::backoffDelayMs(10, config), 30000.0);
}

void TestRetryPolicy::testBackoffDelayMonotonicAndCapped()
{
    cr::RetryConfig config;
    config.baseDelayMs = 250;
    config.maxDelayMs = 5000;
    config.exponentialBase = 3.0;
    config.jitter = false;

    double previous = 0.0;
    for (int attempt = 0; attempt < 20; ++attempt) {
        const double delay = cr::backoffDelayMs(attempt, config);
        QVERIFY(delay >= previous);
        QVERIFY(delay <= config.maxDelayMs);
        previous = delay;
    }
}

void TestRetryPolicy::testBackoffJitterBounded()
{
    cr::RetryConfig config;
    config.baseDelayMs = 1000;
    config.maxDelayMs = 1000;
    config.jitter = true;

    for (int i = 0; i < 200; ++i) {
        const double delay = cr::backoffDelayMs(4, config);
        QVERIFY(delay >= 1000.0);
        QVERIFY(delay <= 1250.0);
    }
}

void TestRetryPolicy::testSucceedsAfterTransientFailures()
{
    int calls = 0;
    std::vector<int> observedAttempts;
    const int value = cr::retryWithBackoff(
        fastConfig(3),
        [&calls]() {
            if (++calls < 3) {
                throw std::runtime_error("timeout");
            }
            return 7;
        },
        QStringLiteral("search"),
        [&observedAttempts](int attempt, const std::exception&, double) {
            observedAttempts.push_back(attempt);
        });

    QCOMPARE(value, 7);
    QCOMPARE(calls, 3);
    QCOMPARE(observedAttempts, (std::vector<int>{0, 1}));
}

void TestRetryPolicy::testRethrowsLastErrorWhenExhausted()
{
    int calls = 0;
    QString message;
    try {
        cr::retryWithBackoff(fastConfig(3), [&calls]() -> int {
            ++calls;
            throw std::runtime_error(QStringLiteral("failure %1").arg(calls).toStdString());
        });
    } catch (const std::runtime_error& error) {
        message = QString::fromUtf8(error.what());
    }

    QCOMPARE(calls, 3);
    QCOMPARE(message, QStringLiteral("failure 3"));
}

void TestRetryPolicy::testNoSleepAfterLastAttempt()
{
    int retries = 0;
    try {
        cr::retryWithBackoff(
            fastConfig(4), []() -> int { throw std::runtime_error("down"); }, QString(),
            [&retries](int, const std::exception&, double) { ++retries; });
    } catch (const std::runtime_error&) {
    }
    QCOMPARE(retries, 3);
}

void TestRetryPolicy::testNonRetryableErrorStopsImmediately()
{
    cr::RetryConfig config = fastConfig(5);
    config.isRetryable = [](const std::exception& error) {
        return dynamic_cast<const std::invalid_argument*>(&error) == nullptr;
    };

    int calls = 0;
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument,
                             cr::retryWithBackoff(config, [&calls]() -> int {
                                 ++calls;
                                 throw std::invalid_argument("bad request");
                             }));
    QCOMPARE(calls, 1);
}

void TestRetryPolicy::testCircuitOpenIsNotRetriedByDefault()
{
    int calls = 0;
    QVERIFY_THROWS_EXCEPTION(cr::CircuitOpenError,
                             cr::retryWithBackoff(fastConfig(3), [&calls]() -> int {
                                 ++calls;
                                 throw cr::CircuitOpenError(QStringLiteral("search"));
                             }));
    QCOMPARE(calls, 1);
}

void TestRetryPolicy::testWithRetryDecorator()
{
    int calls = 0;
    auto doubled = cr::withRetry(fastConfig(2), [&calls](int value) {
        if (++calls == 1) {
            throw std::runtime_error("transient");
        }
        return value * 2;
    });

    QCOMPARE(doubled(5), 10);
    QCOMPARE(calls, 2);
}

void TestRetryPolicy::testValidate()
{
    cr::RetryConfig config;
    config.validate();

    config.maxAttempts = 0;
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, config.validate());

    config = cr::RetryConfig();
    config.maxDelayMs = 10;
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, config.validate());

    config = cr::RetryConfig();
    config.exponentialBase = 0.5;
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, config.validate());
}

QTEST_MAIN(TestRetryPolicy)
#include "test_retry_policy.moc"

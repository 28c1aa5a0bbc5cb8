#pragma once

#include "core/resilience/retry_policy.h"

#include <QObject>
#include <QString>
#include <QVariant>

#include <exception>
#include <functional>

namespace cr {

// Event-loop driven retry. Attempts run on the thread owning this object and
// the backoff delay is a QTimer, so no thread sleeps between attempts. Each
// operation keeps its own attempt counter; any number can run side by side.
class AsyncRetryOperation : public QObject {
    Q_OBJECT
public:
    // Returns the value on success, throws std::exception on failure.
    using Attempt = std::function<QVariant()>;

    AsyncRetryOperation(RetryConfig config, Attempt attempt, QString label,
                        QObject* parent = nullptr);

    void start();

    bool isRunning() const { return m_running; }
    bool isFinished() const { return m_finished; }
    int attemptsMade() const { return m_attemptsMade; }
    const QString& label() const { return m_label; }
    // The error that ended the last failed attempt, null after a success.
    std::exception_ptr lastException() const { return m_lastException; }

signals:
    void attemptFailed(int attempt, const QString& error, double delayMs);
    void succeeded(const QVariant& value);
    void failed(const QString& error);

private:
    void runAttempt();

    RetryConfig m_config;
    Attempt m_attempt;
    QString m_label;
    int m_attemptsMade = 0;
    bool m_running = false;
    bool m_finished = false;
    std::exception_ptr m_lastException;
};

} // namespace cr

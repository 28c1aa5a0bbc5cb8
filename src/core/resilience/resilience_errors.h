#pragma once

#include <QString>

#include <stdexcept>

namespace cr {

// Thrown when a call is rejected because the named breaker is open.
class CircuitOpenError : public std::runtime_error {
public:
    explicit CircuitOpenError(const QString& breakerName)
        : std::runtime_error(QStringLiteral("Circuit breaker '%1' is open").arg(breakerName).toStdString())
        , m_breakerName(breakerName)
    {
    }

    const QString& breakerName() const { return m_breakerName; }

private:
    QString m_breakerName;
};

} // namespace cr

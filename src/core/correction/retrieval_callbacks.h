#pragma once

#include "core/shared/retrieval_result.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <future>
#include <stdexcept>
#include <string>

namespace cr {

struct SearchRequest {
    QString query;
    int topK = 10;
    double lexicalWeight = 0.5;
    double semanticWeight = 0.5;
    // Passed through untouched to the search callback.
    QJsonObject extra;
};

// Thrown when correction needs a capability that was never configured.
class MissingCapabilityError : public std::logic_error {
public:
    explicit MissingCapabilityError(const QString& capability)
        : std::logic_error(QStringLiteral("Required capability not configured: %1")
                               .arg(capability)
                               .toStdString())
        , m_capability(capability)
    {
    }

    const QString& capability() const { return m_capability; }

private:
    QString m_capability;
};

// Upstream capabilities supplied by the retrieval pipeline. Every slot is
// optional; callbacks report failure by throwing a std::exception.
//
// search and searchAsync may be invoked from several threads at once during
// multi-query fan-out. When both are set, searchAsync is preferred.
struct RetrievalCallbacks {
    std::function<ResultList(const SearchRequest&)> search;
    std::function<std::future<ResultList>(const SearchRequest&)> searchAsync;

    // Query -> reformulated variants.
    std::function<QStringList(const QString&)> multiQuery;

    // Query -> query rewritten from a hypothetical answer document.
    std::function<QString(const QString&)> hyde;

    bool canSearch() const { return static_cast<bool>(search) || static_cast<bool>(searchAsync); }
    bool canMultiQuery() const { return static_cast<bool>(multiQuery); }
    bool canHyde() const { return static_cast<bool>(hyde); }
};

} // namespace cr

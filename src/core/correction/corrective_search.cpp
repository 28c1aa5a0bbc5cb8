#include "core/correction/corrective_search.h"
#include "core/fusion/rank_fusion.h"
#include "core/shared/logging.h"
#include "core/shared/thread_group.h"

#include <QElapsedTimer>
#include <QHash>

#include <algorithm>
#include <future>
#include <system_error>
#include <vector>

namespace {

// Trimmed, de-duplicated, capped at maxCount (when > 0). Never empty: an
// empty set of variants degrades to the original query.
QStringList normalizeVariants(const QStringList& generated, const QString& query, int maxCount)
{
    QStringList variants;
    for (const QString& raw : generated) {
        const QString variant = raw.trimmed();
        if (variant.isEmpty() || variants.contains(variant)) {
            continue;
        }
        variants << variant;
        if (maxCount > 0 && variants.size() >= maxCount) {
            break;
        }
    }
    if (variants.isEmpty()) {
        variants << query;
    }
    return variants;
}

// Fusion leaves the RRF score in finalScore, which is not a relevance score
// the gate can judge. Keep the fused order, move the fused score to
// metadata.rrf_score and give each record the best relevance score it had in
// any variant.
void restoreRelevanceScores(cr::ResultList& merged, const std::vector<cr::ResultList>& lists)
{
    QHash<QString, double> bestByKey;
    for (const cr::ResultList& list : lists) {
        for (const cr::RetrievalResult& item : list) {
            const QString key = item.stableKey();
            if (key.isEmpty()) {
                continue;
            }
            const double score = item.effectiveScore();
            auto it = bestByKey.find(key);
            if (it == bestByKey.end()) {
                bestByKey.insert(key, score);
            } else if (score > it.value()) {
                it.value() = score;
            }
        }
    }

    for (cr::RetrievalResult& item : merged) {
        item.metadata.insert(QStringLiteral("rrf_score"), item.finalScore.value_or(0.0));
        item.finalScore = bestByKey.value(item.stableKey(), 0.0);
    }
}

} // namespace

namespace cr {

CorrectiveSearch::CorrectiveSearch(RetrievalCallbacks callbacks,
                                   CircuitBreakerRegistry& registry,
                                   const CorrectionSettings& settings)
    : m_callbacks(std::move(callbacks))
    , m_settings(settings)
    , m_orchestrator(GateConfig(settings.gate))
    , m_searchEndpoint(registry, settings.searchBreakerName, settings.breaker, settings.retry)
    , m_multiQueryEndpoint(registry, settings.multiQueryBreakerName, settings.breaker,
                           settings.retry)
    , m_hydeEndpoint(registry, settings.hydeBreakerName, settings.breaker, settings.retry)
{
}

CorrectionOutcome CorrectiveSearch::searchWithCorrection(const QString& query,
                                                         const ResultList& initialResults,
                                                         int baseTopK,
                                                         const QJsonObject& extra)
{
    QElapsedTimer totalTimer;
    totalTimer.start();

    AuditTrail trail = m_orchestrator.createAuditTrail(query, initialResults);
    ResultList currentResults = initialResults;
    GateEvaluation currentEvaluation = trail.initialEvaluation();

    if (!m_callbacks.canSearch() && m_orchestrator.shouldRetry(currentEvaluation, 0)) {
        throw MissingCapabilityError(QStringLiteral("search"));
    }

    // A generator that is not configured counts as already tried, so the
    // strategy builder never selects it.
    bool triedMultiQuery = !m_callbacks.canMultiQuery();
    bool triedHyde = !m_callbacks.canHyde();
    int round = 0;

    while (m_orchestrator.shouldRetry(currentEvaluation, round)) {
        const std::optional<RetryParameters> params = m_orchestrator.retryParameters(
            currentEvaluation, baseTopK, triedMultiQuery, triedHyde, round);
        if (!params) {
            break;
        }

        LOG_DEBUG(crCorrection, "Round %d: running %s (topK=%d)", round,
                  qUtf8Printable(params->strategyName), params->topK);

        QElapsedTimer attemptTimer;
        attemptTimer.start();
        AttemptResult attempt = runStrategy(query, *params, extra);
        if (attempt.error) {
            LOG_WARN(crCorrection, "Corrective strategy failed: strategy=%s error=%s",
                     qUtf8Printable(params->strategyName), qUtf8Printable(*attempt.error));
        }

        const GateEvaluation attemptEvaluation = m_orchestrator.recordAction(
            trail, params->strategyName, attempt.results, attemptTimer.elapsed(), *params,
            attempt.error);

        // A failed attempt leaves the evidence where it was, so the next round
        // moves on to the next strategy for the same level.
        if (!attempt.error) {
            currentEvaluation = attemptEvaluation;
        }

        if (!attempt.results.empty()
            && attemptEvaluation.bestScore > trail.initialEvaluation().bestScore) {
            currentResults = std::move(attempt.results);
        }

        if (params->useMultiQuery) {
            triedMultiQuery = true;
        }
        if (params->useHyde) {
            triedHyde = true;
        }
        ++round;
    }

    trail.finalize(m_orchestrator.evaluateResults(currentResults), totalTimer.elapsed(),
                   static_cast<int>(currentResults.size()));
    trail.logSummary();

    return CorrectionOutcome{std::move(currentResults), std::move(trail)};
}

QJsonObject CorrectiveSearch::healthStatus() const
{
    QJsonObject json;
    json.insert(m_searchEndpoint.name(), m_searchEndpoint.healthStatus());
    json.insert(m_multiQueryEndpoint.name(), m_multiQueryEndpoint.healthStatus());
    json.insert(m_hydeEndpoint.name(), m_hydeEndpoint.healthStatus());
    return json;
}

CorrectiveSearch::AttemptResult CorrectiveSearch::runStrategy(const QString& query,
                                                              const RetryParameters& params,
                                                              const QJsonObject& extra)
{
    if (params.useMultiQuery && m_callbacks.canMultiQuery()) {
        return runMultiQuery(query, params, extra);
    }
    if (params.useHyde && m_callbacks.canHyde()) {
        return runHyde(query, params, extra);
    }

    SearchRequest request;
    request.query = query;
    request.topK = params.topK;
    request.lexicalWeight = params.lexicalWeight;
    request.semanticWeight = params.semanticWeight;
    request.extra = extra;

    CallResult<ResultList> result = resilientSearch(request);
    if (!result.ok()) {
        return {ResultList(), result.error};
    }
    return {std::move(*result.value), std::nullopt};
}

CorrectiveSearch::AttemptResult CorrectiveSearch::runMultiQuery(const QString& query,
                                                                const RetryParameters& params,
                                                                const QJsonObject& extra)
{
    CallResult<QStringList> generated = m_multiQueryEndpoint.execute<QStringList>(
        [this, &query]() { return m_callbacks.multiQuery(query); });
    if (!generated.ok()) {
        return {ResultList(),
                QStringLiteral("multi-query generation failed: %1").arg(generated.error)};
    }

    const QStringList variants = normalizeVariants(*generated.value, query,
                                                   params.multiQueryCount);

    // One thread per variant; the attempt waits for all of them.
    std::vector<std::promise<CallResult<ResultList>>> promises(
        static_cast<size_t>(variants.size()));
    std::vector<std::future<CallResult<ResultList>>> futures;
    futures.reserve(promises.size());
    for (auto& promise : promises) {
        futures.push_back(promise.get_future());
    }

    ThreadGroup threads;
    threads.reserve(promises.size());
    for (int i = 0; i < variants.size(); ++i) {
        SearchRequest request;
        request.query = variants.at(i);
        request.topK = params.topK;
        request.lexicalWeight = params.lexicalWeight;
        request.semanticWeight = params.semanticWeight;
        request.extra = extra;

        std::promise<CallResult<ResultList>>& promise = promises[static_cast<size_t>(i)];
        auto task = [this, &promise, request]() {
            try {
                promise.set_value(resilientSearch(request));
            } catch (const std::exception&) {
                promise.set_exception(std::current_exception());
            }
        };
        try {
            threads.spawn(task);
        } catch (const std::system_error& error) {
            LOG_WARN(crCorrection, "Could not start a thread for query variant %d, "
                     "running it inline: %s", i, error.what());
            task();
        }
    }
    threads.joinAll();

    std::vector<ResultList> lists;
    lists.reserve(futures.size());
    QStringList errors;
    int failedVariants = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        QString error;
        try {
            CallResult<ResultList> result = futures[i].get();
            if (result.ok()) {
                lists.push_back(std::move(*result.value));
                continue;
            }
            error = result.error;
        } catch (const std::exception& ex) {
            error = QString::fromUtf8(ex.what());
        }

        LOG_WARN(crCorrection, "Query variant %zu failed, treating as empty: %s", i,
                 qUtf8Printable(error));
        lists.push_back(ResultList());
        ++failedVariants;
        if (!errors.contains(error)) {
            errors << error;
        }
    }

    if (failedVariants == static_cast<int>(lists.size())) {
        return {ResultList(),
                QStringLiteral("all %1 query variants failed: %2")
                    .arg(failedVariants)
                    .arg(errors.join(QStringLiteral("; ")))};
    }

    ResultList merged = RankFusion::mergeResultsRrf(lists, params.topK, m_settings.rrfK);
    if (lists.size() > 1) {
        restoreRelevanceScores(merged, lists);
    }
    LOG_DEBUG(crCorrection, "Multi-query fused %d variants into %d results (%d failed)",
              static_cast<int>(lists.size()), static_cast<int>(merged.size()), failedVariants);
    return {std::move(merged), std::nullopt};
}

CorrectiveSearch::AttemptResult CorrectiveSearch::runHyde(const QString& query,
                                                          const RetryParameters& params,
                                                          const QJsonObject& extra)
{
    CallResult<QString> rewritten = m_hydeEndpoint.execute<QString>(
        [this, &query]() { return m_callbacks.hyde(query); });
    if (!rewritten.ok()) {
        return {ResultList(), QStringLiteral("hyde generation failed: %1").arg(rewritten.error)};
    }

    SearchRequest request;
    request.query = rewritten.value->trimmed().isEmpty() ? query : *rewritten.value;
    request.topK = params.topK;
    request.lexicalWeight = params.lexicalWeight;
    request.semanticWeight = params.semanticWeight;
    request.extra = extra;

    CallResult<ResultList> result = resilientSearch(request);
    if (!result.ok()) {
        return {ResultList(), result.error};
    }
    return {std::move(*result.value), std::nullopt};
}

CallResult<ResultList> CorrectiveSearch::resilientSearch(const SearchRequest& request)
{
    return m_searchEndpoint.execute<ResultList>(
        [this, &request]() { return invokeSearch(request); }, ResultList());
}

ResultList CorrectiveSearch::invokeSearch(const SearchRequest& request) const
{
    if (m_callbacks.searchAsync) {
        return m_callbacks.searchAsync(request).get();
    }
    if (m_callbacks.search) {
        return m_callbacks.search(request);
    }
    throw MissingCapabilityError(QStringLiteral("search"));
}

} // namespace cr

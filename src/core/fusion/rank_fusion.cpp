#include "core/fusion/rank_fusion.h"
#include "core/shared/logging.h"

#include <QHash>
#include <QSet>

#include <algorithm>

namespace {

struct FusedEntry {
    cr::RetrievalResult result;
    double score = 0.0;
    QSet<QString> sources;
};

// Accumulates fused scores per stable key while remembering first-seen order.
class FusionAccumulator {
public:
    void add(const cr::RetrievalResult& item, double contribution, const QString& source)
    {
        const QString key = item.stableKey();
        if (key.isEmpty()) {
            ++m_skipped;
            return;
        }

        auto it = m_indexByKey.constFind(key);
        int index = 0;
        if (it == m_indexByKey.constEnd()) {
            FusedEntry entry;
            entry.result = item;
            entry.result.id = key;
            entry.result.originalScore = item.score;
            index = static_cast<int>(m_entries.size());
            m_indexByKey.insert(key, index);
            m_entries.push_back(std::move(entry));
        } else {
            index = it.value();
        }

        FusedEntry& entry = m_entries[static_cast<size_t>(index)];
        entry.score += contribution;
        entry.sources.insert(source);
        const QString engine = item.metadata.value(QStringLiteral("engine")).toString();
        if (!engine.isEmpty()) {
            entry.sources.insert(engine);
        }
    }

    FusedEntry& entryFor(const cr::RetrievalResult& item)
    {
        return m_entries[static_cast<size_t>(m_indexByKey.value(item.stableKey()))];
    }

    bool contains(const cr::RetrievalResult& item) const
    {
        const QString key = item.stableKey();
        return !key.isEmpty() && m_indexByKey.contains(key);
    }

    std::vector<FusedEntry>& entries() { return m_entries; }
    int skipped() const { return m_skipped; }

private:
    QHash<QString, int> m_indexByKey;
    std::vector<FusedEntry> m_entries;
    int m_skipped = 0;
};

double computeRrfContribution(double weight, int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    return weight * cr::RankFusion::rrfScore(rank, rrfK);
}

QStringList sortedSources(const QSet<QString>& sources)
{
    QStringList list(sources.begin(), sources.end());
    list.sort();
    return list;
}

cr::ResultList passThrough(const cr::ResultList& results, int topK, const QString& source)
{
    const size_t limit = std::min(results.size(), static_cast<size_t>(std::max(topK, 0)));
    cr::ResultList out(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(limit));
    for (cr::RetrievalResult& item : out) {
        if (!item.finalScore.has_value()) {
            item.finalScore = item.score.value_or(0.0);
        }
        if (!item.originalScore.has_value()) {
            item.originalScore = item.score;
        }
        if (item.sources.isEmpty()) {
            item.sources = QStringList{source};
            item.fusionCount = 1;
        }
    }
    return out;
}

cr::ResultList finish(std::vector<FusedEntry>& entries, int topK)
{
    cr::ResultList merged;
    merged.reserve(entries.size());
    for (FusedEntry& entry : entries) {
        cr::RetrievalResult result = std::move(entry.result);
        result.finalScore = entry.score;
        result.sources = sortedSources(entry.sources);
        result.fusionCount = static_cast<int>(entry.sources.size());
        merged.push_back(std::move(result));
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const cr::RetrievalResult& lhs, const cr::RetrievalResult& rhs) {
                         return lhs.finalScore.value_or(0.0) > rhs.finalScore.value_or(0.0);
                     });

    const size_t limit = static_cast<size_t>(std::max(topK, 0));
    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

} // namespace

namespace cr {

double RankFusion::rrfScore(int rank, int k)
{
    const int denom = k + rank;
    if (denom <= 0) {
        return 0.0;
    }
    return 1.0 / static_cast<double>(denom);
}

ResultList RankFusion::mergeResultsRrf(const std::vector<ResultList>& resultLists,
                                       int topK,
                                       int k)
{
    if (resultLists.empty()) {
        return {};
    }
    if (resultLists.size() == 1) {
        return passThrough(resultLists.front(), topK, QStringLiteral("query_0"));
    }

    FusionAccumulator accumulator;
    for (size_t listIdx = 0; listIdx < resultLists.size(); ++listIdx) {
        const QString source = QStringLiteral("query_%1").arg(static_cast<qulonglong>(listIdx));
        const ResultList& results = resultLists[listIdx];
        for (size_t i = 0; i < results.size(); ++i) {
            accumulator.add(results[i],
                            computeRrfContribution(1.0, static_cast<int>(i) + 1, k),
                            source);
        }
    }

    if (accumulator.skipped() > 0) {
        LOG_DEBUG(crFusion, "RRF merge skipped %d results without id or text",
                  accumulator.skipped());
    }
    return finish(accumulator.entries(), topK);
}

ResultList RankFusion::mergeLexicalVectorRrf(const ResultList& lexical,
                                             const ResultList& vector,
                                             LexicalVectorFusionConfig config)
{
    if (lexical.empty() && vector.empty()) {
        return {};
    }
    if (lexical.empty()) {
        ResultList out = passThrough(vector, config.maxResults, QStringLiteral("vector"));
        for (RetrievalResult& item : out) {
            item.vectorScore = item.score.value_or(0.0);
        }
        return out;
    }
    if (vector.empty()) {
        ResultList out = passThrough(lexical, config.maxResults, QStringLiteral("lexical"));
        for (RetrievalResult& item : out) {
            item.lexicalScore = item.score.value_or(0.0);
        }
        return out;
    }

    FusionAccumulator accumulator;
    for (size_t i = 0; i < lexical.size(); ++i) {
        const RetrievalResult& item = lexical[i];
        accumulator.add(item,
                        computeRrfContribution(config.lexicalWeight, static_cast<int>(i) + 1,
                                               config.rrfK),
                        QStringLiteral("lexical"));
        if (accumulator.contains(item)) {
            FusedEntry& entry = accumulator.entryFor(item);
            if (!entry.result.lexicalScore.has_value()) {
                entry.result.lexicalScore = item.score.value_or(0.0);
            }
        }
    }
    for (size_t i = 0; i < vector.size(); ++i) {
        const RetrievalResult& item = vector[i];
        accumulator.add(item,
                        computeRrfContribution(config.vectorWeight, static_cast<int>(i) + 1,
                                               config.rrfK),
                        QStringLiteral("vector"));
        if (accumulator.contains(item)) {
            FusedEntry& entry = accumulator.entryFor(item);
            if (!entry.result.vectorScore.has_value()) {
                entry.result.vectorScore = item.score.value_or(0.0);
            }
        }
    }

    for (FusedEntry& entry : accumulator.entries()) {
        entry.result.hybrid = entry.sources.contains(QStringLiteral("lexical"))
            && entry.sources.contains(QStringLiteral("vector"));
    }
    return finish(accumulator.entries(), config.maxResults);
}

} // namespace cr

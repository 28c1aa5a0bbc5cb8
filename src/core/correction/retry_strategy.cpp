#include "core/correction/retry_strategy.h"

#include <algorithm>

namespace cr {

QJsonObject RetryParameters::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("topK")] = topK;
    json[QStringLiteral("lexicalWeight")] = lexicalWeight;
    json[QStringLiteral("semanticWeight")] = semanticWeight;
    json[QStringLiteral("useMultiQuery")] = useMultiQuery;
    json[QStringLiteral("multiQueryCount")] = multiQueryCount;
    json[QStringLiteral("useHyde")] = useHyde;
    json[QStringLiteral("strategyName")] = strategyName;
    return json;
}

std::optional<RetryParameters> RetryParameters::fromJson(const QJsonObject& json)
{
    const QString name = json.value(QStringLiteral("strategyName")).toString();
    if (name.isEmpty() || !json.value(QStringLiteral("topK")).isDouble()) {
        return std::nullopt;
    }

    RetryParameters params;
    params.strategyName = name;
    params.topK = json.value(QStringLiteral("topK")).toInt(params.topK);
    params.lexicalWeight = json.value(QStringLiteral("lexicalWeight")).toDouble(params.lexicalWeight);
    params.semanticWeight = json.value(QStringLiteral("semanticWeight")).toDouble(params.semanticWeight);
    params.useMultiQuery = json.value(QStringLiteral("useMultiQuery")).toBool(false);
    params.multiQueryCount = json.value(QStringLiteral("multiQueryCount")).toInt(0);
    params.useHyde = json.value(QStringLiteral("useHyde")).toBool(false);
    return params;
}

QJsonObject RetryAdjustments::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("useHyde")] = useHyde;
    json[QStringLiteral("useMultiQuery")] = useMultiQuery;
    json[QStringLiteral("topKMultiplier")] = topKMultiplier;
    json[QStringLiteral("lexicalWeight")] = lexicalWeight;
    json[QStringLiteral("semanticWeight")] = semanticWeight;
    return json;
}

RetryStrategyBuilder::RetryStrategyBuilder(GateConfig config, int baseTopK)
    : m_config(std::move(config))
    , m_baseTopK(std::max(baseTopK, 1))
{
}

int RetryStrategyBuilder::scaledTopK(double multiplier) const
{
    const int scaled = static_cast<int>(static_cast<double>(m_baseTopK) * multiplier);
    return std::min(scaled, kMaxRetryTopK);
}

std::vector<RetryParameters> RetryStrategyBuilder::buildStrategies(EvidenceLevel level,
                                                                   bool alreadyTriedMultiQuery,
                                                                   bool alreadyTriedHyde) const
{
    std::vector<RetryParameters> strategies;

    if (level == EvidenceLevel::Strong) {
        return strategies;
    }

    if (level == EvidenceLevel::Moderate) {
        RetryParameters expand;
        expand.topK = scaledTopK(1.5);
        expand.strategyName = QLatin1String(kStrategyExpandTopK);
        strategies.push_back(expand);
    } else {
        RetryParameters aggressive;
        aggressive.topK = scaledTopK(m_config.aggressiveTopKMultiplier());
        aggressive.lexicalWeight = m_config.aggressiveLexicalWeight();
        aggressive.semanticWeight = m_config.aggressiveSemanticWeight();
        aggressive.strategyName = QLatin1String(kStrategyAggressiveHybrid);
        strategies.push_back(aggressive);

        const bool multiQueryAvailable = m_config.multiQueryEnabled() && !alreadyTriedMultiQuery;
        if (multiQueryAvailable) {
            RetryParameters multiQuery;
            multiQuery.topK = m_baseTopK;
            multiQuery.useMultiQuery = true;
            multiQuery.multiQueryCount = m_config.multiQueryFanout();
            multiQuery.strategyName = QLatin1String(kStrategyMultiQuery);
            strategies.push_back(multiQuery);
        }

        if (m_config.hydeEnabled() && !alreadyTriedHyde) {
            RetryParameters hyde;
            hyde.topK = m_baseTopK;
            hyde.lexicalWeight = 0.4;
            hyde.semanticWeight = 0.6;
            hyde.useHyde = true;
            hyde.strategyName = QLatin1String(kStrategyHyde);
            strategies.push_back(hyde);
        }

        if (level == EvidenceLevel::Insufficient && multiQueryAvailable) {
            RetryParameters combined = aggressive;
            combined.useMultiQuery = true;
            combined.multiQueryCount = m_config.multiQueryFanout();
            combined.strategyName = QLatin1String(kStrategyAggressiveMultiQuery);
            strategies.push_back(combined);
        }
    }

    const size_t limit = static_cast<size_t>(std::max(m_config.maxRetryRounds(), 0));
    if (strategies.size() > limit) {
        strategies.resize(limit);
    }
    return strategies;
}

RetryAdjustments RetryStrategyBuilder::suggestAdjustments(EvidenceLevel level, int round) const
{
    RetryAdjustments adjustments;

    if (level == EvidenceLevel::Strong) {
        return adjustments;
    }
    if (level == EvidenceLevel::Moderate) {
        adjustments.topKMultiplier = 1.5;
        return adjustments;
    }

    if (round <= 0) {
        adjustments.topKMultiplier = m_config.aggressiveTopKMultiplier();
        adjustments.lexicalWeight = m_config.aggressiveLexicalWeight();
        adjustments.semanticWeight = m_config.aggressiveSemanticWeight();
    } else if (round == 1) {
        adjustments.useMultiQuery = m_config.multiQueryEnabled();
        adjustments.topKMultiplier = 1.5;
    } else {
        adjustments.useHyde = m_config.hydeEnabled();
        adjustments.lexicalWeight = 0.4;
        adjustments.semanticWeight = 0.6;
    }
    return adjustments;
}

} // namespace cr

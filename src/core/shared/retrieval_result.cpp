#include "core/shared/retrieval_result.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonValue>

#include <cmath>

namespace {

std::optional<double> usableScore(const std::optional<double>& value)
{
    if (!value.has_value() || !std::isfinite(*value) || *value == 0.0) {
        return std::nullopt;
    }
    return value;
}

// Accepts JSON numbers and numeric strings; anything else is treated as absent.
std::optional<double> parseScore(const QJsonValue& value)
{
    if (value.isDouble()) {
        const double parsed = value.toDouble();
        return std::isfinite(parsed) ? std::optional<double>(parsed) : std::nullopt;
    }
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(parsed)) {
            return parsed;
        }
    }
    return std::nullopt;
}

QString firstString(const QJsonObject& json, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        const QJsonValue value = json.value(QLatin1String(key));
        if (value.isString() && !value.toString().isEmpty()) {
            return value.toString();
        }
    }
    return {};
}

void insertOptional(QJsonObject& json, const QString& key, const std::optional<double>& value)
{
    if (value.has_value()) {
        json.insert(key, *value);
    }
}

} // namespace

namespace cr {

double RetrievalResult::effectiveScore() const
{
    if (auto value = usableScore(finalScore)) {
        return *value;
    }
    if (auto value = usableScore(score)) {
        return *value;
    }
    if (auto value = usableScore(rerankScore)) {
        return *value;
    }
    return 0.0;
}

QString RetrievalResult::stableKey() const
{
    if (!id.isEmpty()) {
        return id;
    }
    if (text.isEmpty()) {
        return {};
    }
    return contentHashKey(text);
}

QString contentHashKey(const QString& text)
{
    const QByteArray prefix = text.left(kContentHashPrefixChars).toUtf8();
    const QByteArray digest = QCryptographicHash::hash(prefix, QCryptographicHash::Md5).toHex();
    return QString::fromLatin1(digest.left(16));
}

RetrievalResult RetrievalResult::fromJson(const QJsonObject& json)
{
    RetrievalResult result;
    result.id = firstString(json, {"chunk_uid", "id"});
    result.text = firstString(json, {"text", "content"});
    result.finalScore = parseScore(json.value(QStringLiteral("final_score")));
    result.score = parseScore(json.value(QStringLiteral("score")));
    result.rerankScore = parseScore(json.value(QStringLiteral("rerank_score")));

    const QJsonValue metadata = json.value(QStringLiteral("metadata"));
    if (metadata.isObject()) {
        result.metadata = metadata.toObject();
    }
    const QString engine = json.value(QStringLiteral("engine")).toString();
    if (!engine.isEmpty() && !result.metadata.contains(QStringLiteral("engine"))) {
        result.metadata.insert(QStringLiteral("engine"), engine);
    }
    return result;
}

QJsonObject RetrievalResult::toJson() const
{
    QJsonObject json;
    if (!id.isEmpty()) {
        json.insert(QStringLiteral("chunk_uid"), id);
    }
    json.insert(QStringLiteral("text"), text);
    insertOptional(json, QStringLiteral("score"), score);
    insertOptional(json, QStringLiteral("final_score"), finalScore);
    insertOptional(json, QStringLiteral("rerank_score"), rerankScore);
    insertOptional(json, QStringLiteral("original_score"), originalScore);
    json.insert(QStringLiteral("metadata"), metadata);

    if (!sources.isEmpty()) {
        json.insert(QStringLiteral("sources"), QJsonArray::fromStringList(sources));
        json.insert(QStringLiteral("fusion_count"), fusionCount);
    }
    if (lexicalScore.has_value() || vectorScore.has_value()) {
        QJsonObject originals;
        insertOptional(originals, QStringLiteral("lexical"), lexicalScore);
        insertOptional(originals, QStringLiteral("vector"), vectorScore);
        json.insert(QStringLiteral("original_scores"), originals);
        json.insert(QStringLiteral("is_hybrid"), hybrid);
    }
    return json;
}

std::vector<double> extractScores(const ResultList& results)
{
    std::vector<double> scores;
    scores.reserve(results.size());
    for (const RetrievalResult& result : results) {
        scores.push_back(result.effectiveScore());
    }
    return scores;
}

} // namespace cr

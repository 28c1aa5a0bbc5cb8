#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace cr {

// One scored candidate handed to the correction loop by the retrieval pipeline.
//
// Score lookup order is fixed: finalScore, then score, then rerankScore.
// A field counts only when it is present, finite and non-zero; if none
// qualifies the effective score is 0.
struct RetrievalResult {
    QString id;
    QString text;
    std::optional<double> score;
    std::optional<double> finalScore;
    std::optional<double> rerankScore;
    QJsonObject metadata;

    // Filled in by rank fusion.
    QStringList sources;
    int fusionCount = 0;
    bool hybrid = false;
    std::optional<double> originalScore;
    std::optional<double> lexicalScore;
    std::optional<double> vectorScore;

    double effectiveScore() const;

    // Explicit id when set, otherwise a content hash of the leading text.
    // Empty when the record has neither.
    QString stableKey() const;

    // Lenient parse of a loosely-typed record. Unknown keys land in metadata,
    // unparsable scores are dropped rather than rejected.
    static RetrievalResult fromJson(const QJsonObject& json);
    QJsonObject toJson() const;
};

using ResultList = std::vector<RetrievalResult>;

// Leading characters of text that feed the content hash.
constexpr int kContentHashPrefixChars = 200;

QString contentHashKey(const QString& text);

std::vector<double> extractScores(const ResultList& results);

} // namespace cr

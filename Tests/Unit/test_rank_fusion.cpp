#include <QtTest/QtTest>
#include "core/fusion/rank_fusion.h"

#include <QJsonObject>

class TestRankFusion : public QObject {
    Q_OBJECT

private slots:
    void testRrfScoreFirstRank();
    void testRrfScoreStrictlyDecreasing();
    void testEmptyInput();
    void testSingleListPreservesOrderAndScores();
    void testSingleListIsIdempotent();
    void testSingleListKeepsExistingFinalScore();
    void testSingleListTruncatesToTopK();
    void testMergeAccumulatesSharedIds();
    void testMergeTieBreaksByFirstSeen();
    void testMergeTracksSourcesAndEngine();
    void testMergeKeysByContentHashWithoutId();
    void testMergeSkipsKeylessRecords();
    void testLexicalVectorDisjointLists();
    void testLexicalVectorSharedTopResult();
    void testLexicalVectorWeightsBalanceSources();
    void testLexicalVectorOneSideEmpty();

private:
    static cr::RetrievalResult makeResult(const QString& id, double score);
    static cr::ResultList makeList(const QString& prefix, int count, double topScore);
};

cr::RetrievalResult TestRankFusion::makeResult(const QString& id, double score)
{
    cr::RetrievalResult result;
    result.id = id;
    result.text = QStringLiteral("text for %1").arg(id);
    result.score = score;
    return result;
}

cr::ResultList TestRankFusion::makeList(const QString& prefix, int count, double topScore)
{
    cr::ResultList list;
    for (int i = 0; i < count; ++i) {
        list.push_back(makeResult(QStringLiteral("%1-%2").arg(prefix).arg(i), topScore - 0.05 * i));
    }
    return list;
}

void TestRankFusion::testRrfScoreFirstRank()
{
    QCOMPARE(cr::RankFusion::rrfScore(1), 1.0 / 61.0);
    QCOMPARE(cr::RankFusion::rrfScore(1, 10), 1.0 / 11.0);
}

void TestRankFusion::testRrfScoreStrictlyDecreasing()
{
    for (int k : {1, 10, 60}) {
        for (int rank = 1; rank < 50; ++rank) {
            QVERIFY(cr::RankFusion::rrfScore(rank, k) > cr::RankFusion::rrfScore(rank + 1, k));
        }
    }
}

void TestRankFusion::testEmptyInput()
{
    QVERIFY(cr::RankFusion::mergeResultsRrf({}).empty());
    QVERIFY(cr::RankFusion::mergeLexicalVectorRrf({}, {}).empty());
}

void TestRankFusion::testSingleListPreservesOrderAndScores()
{
    // Deliberately not sorted by score: native order must survive.
    cr::ResultList list = {
        makeResult(QStringLiteral("b"), 0.3),
        makeResult(QStringLiteral("a"), 0.9),
        makeResult(QStringLiteral("c"), 0.5),
    };

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf({list}, 10);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    for (size_t i = 0; i < list.size(); ++i) {
        QCOMPARE(merged[i].id, list[i].id);
        QVERIFY(merged[i].finalScore.has_value());
        QVERIFY(merged[i].originalScore.has_value());
        QCOMPARE(*merged[i].finalScore, *list[i].score);
        QCOMPARE(*merged[i].finalScore, *merged[i].originalScore);
    }
}

void TestRankFusion::testSingleListIsIdempotent()
{
    const cr::ResultList once = cr::RankFusion::mergeResultsRrf(
        {makeList(QStringLiteral("q"), 4, 0.8)}, 10);
    const cr::ResultList twice = cr::RankFusion::mergeResultsRrf({once}, 10);

    QCOMPARE(twice.size(), once.size());
    for (size_t i = 0; i < once.size(); ++i) {
        QCOMPARE(twice[i].id, once[i].id);
        QCOMPARE(twice[i].finalScore.value_or(-1.0), once[i].finalScore.value_or(-1.0));
    }
}

void TestRankFusion::testSingleListKeepsExistingFinalScore()
{
    cr::RetrievalResult reranked = makeResult(QStringLiteral("r"), 0.4);
    reranked.finalScore = 0.85;
    const cr::ResultList list{reranked};
    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf({list}, 10);

    QCOMPARE(static_cast<int>(merged.size()), 1);
    QCOMPARE(merged[0].finalScore.value_or(-1.0), 0.85);
    QCOMPARE(merged[0].originalScore.value_or(-1.0), 0.4);
}

void TestRankFusion::testSingleListTruncatesToTopK()
{
    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf(
        {makeList(QStringLiteral("q"), 8, 0.9)}, 3);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[2].id, QStringLiteral("q-2"));
}

void TestRankFusion::testMergeAccumulatesSharedIds()
{
    const cr::ResultList first = {makeResult(QStringLiteral("x"), 0.2),
                                  makeResult(QStringLiteral("shared"), 0.9)};
    const cr::ResultList second = {makeResult(QStringLiteral("shared"), 0.1),
                                   makeResult(QStringLiteral("y"), 0.8)};

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf({first, second}, 10, 60);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[0].id, QStringLiteral("shared"));
    QCOMPARE(*merged[0].finalScore, 1.0 / 62.0 + 1.0 / 61.0);
    QCOMPARE(merged[0].fusionCount, 2);
    // Payload comes from the first occurrence.
    QCOMPARE(*merged[0].originalScore, 0.9);
}

void TestRankFusion::testMergeTieBreaksByFirstSeen()
{
    const cr::ResultList first = {makeResult(QStringLiteral("a"), 0.1)};
    const cr::ResultList second = {makeResult(QStringLiteral("b"), 0.9)};
    const cr::ResultList third = {makeResult(QStringLiteral("c"), 0.5)};

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf({first, second, third}, 10);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[0].id, QStringLiteral("a"));
    QCOMPARE(merged[1].id, QStringLiteral("b"));
    QCOMPARE(merged[2].id, QStringLiteral("c"));

    const cr::ResultList again = cr::RankFusion::mergeResultsRrf({first, second, third}, 10);
    for (size_t i = 0; i < merged.size(); ++i) {
        QCOMPARE(again[i].id, merged[i].id);
    }
}

void TestRankFusion::testMergeTracksSourcesAndEngine()
{
    cr::RetrievalResult tagged = makeResult(QStringLiteral("t"), 0.7);
    tagged.metadata.insert(QStringLiteral("engine"), QStringLiteral("opensearch"));

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf(
        {{tagged}, {makeResult(QStringLiteral("t"), 0.6)}}, 10);
    QCOMPARE(static_cast<int>(merged.size()), 1);
    QCOMPARE(merged[0].sources,
             (QStringList{QStringLiteral("opensearch"), QStringLiteral("query_0"),
                          QStringLiteral("query_1")}));
    QCOMPARE(merged[0].fusionCount, 3);
}

void TestRankFusion::testMergeKeysByContentHashWithoutId()
{
    cr::RetrievalResult first;
    first.text = QStringLiteral("identical passage");
    first.score = 0.4;
    cr::RetrievalResult second = first;
    second.score = 0.2;

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf({{first}, {second}}, 10);
    QCOMPARE(static_cast<int>(merged.size()), 1);
    QCOMPARE(merged[0].id, cr::contentHashKey(first.text));
}

void TestRankFusion::testMergeSkipsKeylessRecords()
{
    cr::RetrievalResult keyless;
    keyless.score = 0.99;

    const cr::ResultList merged = cr::RankFusion::mergeResultsRrf(
        {{keyless, makeResult(QStringLiteral("a"), 0.5)}, {makeResult(QStringLiteral("b"), 0.4)}},
        10);
    QCOMPARE(static_cast<int>(merged.size()), 2);
    for (const cr::RetrievalResult& result : merged) {
        QVERIFY(!result.id.isEmpty());
    }
}

void TestRankFusion::testLexicalVectorDisjointLists()
{
    cr::LexicalVectorFusionConfig config;
    config.maxResults = 20;
    const cr::ResultList merged = cr::RankFusion::mergeLexicalVectorRrf(
        makeList(QStringLiteral("lex"), 5, 0.9), makeList(QStringLiteral("vec"), 5, 0.9), config);

    QCOMPARE(static_cast<int>(merged.size()), 10);
    for (const cr::RetrievalResult& result : merged) {
        QVERIFY(!result.hybrid);
    }
}

void TestRankFusion::testLexicalVectorSharedTopResult()
{
    cr::ResultList lexical = makeList(QStringLiteral("lex"), 3, 0.9);
    cr::ResultList vector = makeList(QStringLiteral("vec"), 3, 0.9);
    lexical[0] = makeResult(QStringLiteral("both"), 12.5);
    vector[0] = makeResult(QStringLiteral("both"), 0.83);

    const cr::ResultList merged = cr::RankFusion::mergeLexicalVectorRrf(lexical, vector);
    QVERIFY(!merged.empty());
    const cr::RetrievalResult& top = merged.front();
    QCOMPARE(top.id, QStringLiteral("both"));
    QVERIFY(top.hybrid);
    QCOMPARE(*top.finalScore,
             0.5 * cr::RankFusion::rrfScore(1, 60) + 0.5 * cr::RankFusion::rrfScore(1, 60));
    QCOMPARE(*top.lexicalScore, 12.5);
    QCOMPARE(*top.vectorScore, 0.83);
    QCOMPARE(top.sources, (QStringList{QStringLiteral("lexical"), QStringLiteral("vector")}));
}

void TestRankFusion::testLexicalVectorWeightsBalanceSources()
{
    cr::LexicalVectorFusionConfig config;
    config.lexicalWeight = 0.2;
    config.vectorWeight = 0.8;

    const cr::ResultList merged = cr::RankFusion::mergeLexicalVectorRrf(
        {makeResult(QStringLiteral("lex"), 0.9)}, {makeResult(QStringLiteral("vec"), 0.1)}, config);
    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].id, QStringLiteral("vec"));
}

void TestRankFusion::testLexicalVectorOneSideEmpty()
{
    cr::LexicalVectorFusionConfig config;
    config.maxResults = 2;
    const cr::ResultList merged = cr::RankFusion::mergeLexicalVectorRrf(
        {}, makeList(QStringLiteral("vec"), 4, 0.7), config);

    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].id, QStringLiteral("vec-0"));
    QCOMPARE(*merged[0].finalScore, 0.7);
    QCOMPARE(*merged[0].vectorScore, 0.7);
    QVERIFY(!merged[0].hybrid);
}

QTEST_MAIN(TestRankFusion)
#include "test_rank_fusion.moc"

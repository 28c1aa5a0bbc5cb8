#include <QtTest/QtTest>
#include "core/correction/correction_orchestrator.h"

#include <optional>

class TestCorrectionOrchestrator : public QObject {
    Q_OBJECT

private slots:
    void testNoRetryWhenGatePasses();
    void testRetryForWeakEvidence();
    void testRetryCapped();
    void testEmptyResultsRetriedOnlyOnce();
    void testRetryParametersIndexedByRound();
    void testRetryParametersExhausted();
    void testRetryParametersSkipTriedFamilies();
    void testAuditTrailStartsFromInitialResults();
    void testRecordActionAppendsEvaluation();
    void testRecordFailedAction();
    void testRecordWeakAttemptNotSuccessful();

private:
    static cr::ResultList makeResults(std::initializer_list<double> scores);
};

cr::ResultList TestCorrectionOrchestrator::makeResults(std::initializer_list<double> scores)
{
    cr::ResultList results;
    int i = 0;
    for (double score : scores) {
        cr::RetrievalResult result;
        result.id = QStringLiteral("doc-%1").arg(i++);
        result.text = QStringLiteral("chunk text");
        result.score = score;
        results.push_back(result);
    }
    return results;
}

void TestCorrectionOrchestrator::testNoRetryWhenGatePasses()
{
    const cr::CorrectionOrchestrator orchestrator;
    const cr::GateEvaluation strong = orchestrator.evaluateResults(makeResults({0.9, 0.8, 0.7}));
    QVERIFY(strong.gatePassed);
    QVERIFY(!orchestrator.shouldRetry(strong, 0));

    const cr::GateEvaluation moderate = orchestrator.evaluateResults(makeResults({0.6, 0.4, 0.3}));
    QCOMPARE(moderate.evidenceLevel, cr::EvidenceLevel::Moderate);
    QVERIFY(!orchestrator.shouldRetry(moderate, 0));
}

void TestCorrectionOrchestrator::testRetryForWeakEvidence()
{
    const cr::CorrectionOrchestrator orchestrator;
    const cr::GateEvaluation low = orchestrator.evaluateResults(makeResults({0.3, 0.2}));
    QVERIFY(orchestrator.shouldRetry(low, 0));
    QVERIFY(orchestrator.shouldRetry(low, 1));

    const cr::GateEvaluation empty = orchestrator.evaluateResults({});
    QVERIFY(orchestrator.shouldRetry(empty, 0));
}

void TestCorrectionOrchestrator::testRetryCapped()
{
    cr::GateConfigValues values;
    values.maxRetryRounds = 1;
    const cr::CorrectionOrchestrator orchestrator{cr::GateConfig(values)};
    const cr::GateEvaluation low = orchestrator.evaluateResults(makeResults({0.3}));

    QVERIFY(orchestrator.shouldRetry(low, 0));
    QVERIFY(!orchestrator.shouldRetry(low, 1));
    QVERIFY(!orchestrator.shouldRetry(low, 5));

    values.maxRetryRounds = 0;
    const cr::CorrectionOrchestrator disabled{cr::GateConfig(values)};
    QVERIFY(!disabled.shouldRetry(low, 0));
}

void TestCorrectionOrchestrator::testEmptyResultsRetriedOnlyOnce()
{
    cr::GateConfigValues values;
    values.maxRetryRounds = 4;
    const cr::CorrectionOrchestrator orchestrator{cr::GateConfig(values)};
    const cr::GateEvaluation empty = orchestrator.evaluateResults({});

    QVERIFY(orchestrator.shouldRetry(empty, 0));
    QVERIFY(!orchestrator.shouldRetry(empty, 1));
}

void TestCorrectionOrchestrator::testRetryParametersIndexedByRound()
{
    const cr::CorrectionOrchestrator orchestrator;
    const cr::GateEvaluation low = orchestrator.evaluateResults(makeResults({0.3, 0.2}));

    const std::optional<cr::RetryParameters> first =
        orchestrator.retryParameters(low, 10, false, false, 0);
    QVERIFY(first.has_value());
    QCOMPARE(first->strategyName, QStringLiteral("aggressive_hybrid"));
    QCOMPARE(first->topK, 20);

    const std::optional<cr::RetryParameters> second =
        orchestrator.retryParameters(low, 10, false, false, 1);
    QVERIFY(second.has_value());
    QCOMPARE(second->strategyName, QStringLiteral("multi_query"));
}

void TestCorrectionOrchestrator::testRetryParametersExhausted()
{
    const cr::CorrectionOrchestrator orchestrator;
    const cr::GateEvaluation low = orchestrator.evaluateResults(makeResults({0.3, 0.2}));

    QVERIFY(!orchestrator.retryParameters(low, 10, false, false, 2).has_value());
    QVERIFY(!orchestrator.retryParameters(low, 10, false, false, -1).has_value());

    const cr::GateEvaluation strong = orchestrator.evaluateResults(makeResults({0.9, 0.8, 0.7}));
    QVERIFY(!orchestrator.retryParameters(strong, 10, false, false, 0).has_value());

    // Moderate evidence passes the gate, so no expand_top_k round is offered.
    const cr::GateEvaluation moderate = orchestrator.evaluateResults(makeResults({0.6, 0.4, 0.3}));
    QVERIFY(!orchestrator.retryParameters(moderate, 10, false, false, 0).has_value());
}

void TestCorrectionOrchestrator::testRetryParametersSkipTriedFamilies()
{
    cr::GateConfigValues values;
    values.maxRetryRounds = 3;
    const cr::CorrectionOrchestrator orchestrator{cr::GateConfig(values)};
    const cr::GateEvaluation low = orchestrator.evaluateResults(makeResults({0.2}));

    // With multi-query already tried, round 1 falls through to HyDE.
    const std::optional<cr::RetryParameters> params =
        orchestrator.retryParameters(low, 10, true, false, 1);
    QVERIFY(params.has_value());
    QCOMPARE(params->strategyName, QStringLiteral("hyde"));
    QVERIFY(params->useHyde);

    QVERIFY(!orchestrator.retryParameters(low, 10, true, true, 1).has_value());
}

void TestCorrectionOrchestrator::testAuditTrailStartsFromInitialResults()
{
    const cr::CorrectionOrchestrator orchestrator;
    const cr::AuditTrail trail =
        orchestrator.createAuditTrail(QStringLiteral("rust async"), makeResults({0.3, 0.1}));

    QCOMPARE(trail.query(), QStringLiteral("rust async"));
    QCOMPARE(trail.initialEvaluation().resultCount, 2);
    QCOMPARE(trail.initialEvaluation().bestScore, 0.3);
    QVERIFY(!trail.initialEvaluation().gatePassed);
    QVERIFY(trail.actions().empty());
}

void TestCorrectionOrchestrator::testRecordActionAppendsEvaluation()
{
    const cr::CorrectionOrchestrator orchestrator;
    cr::AuditTrail trail = orchestrator.createAuditTrail(QStringLiteral("q"), {});

    cr::RetryParameters params;
    params.strategyName = QStringLiteral("aggressive_hybrid");
    params.topK = 20;

    const cr::GateEvaluation evaluation = orchestrator.recordAction(
        trail, params.strategyName, makeResults({0.8, 0.6, 0.4}), 33, params);

    QVERIFY(evaluation.gatePassed);
    QCOMPARE(static_cast<int>(trail.actions().size()), 1);
    const cr::CorrectiveAction& action = trail.actions().front();
    QVERIFY(action.success);
    QVERIFY(!action.error.has_value());
    QCOMPARE(action.resultCount, 3);
    QCOMPARE(action.bestScore, 0.8);
    QCOMPARE(action.durationMs, static_cast<int64_t>(33));
    QCOMPARE(action.parameters.topK, 20);
}

void TestCorrectionOrchestrator::testRecordFailedAction()
{
    const cr::CorrectionOrchestrator orchestrator;
    cr::AuditTrail trail = orchestrator.createAuditTrail(QStringLiteral("q"), makeResults({0.2}));

    cr::RetryParameters params;
    params.strategyName = QStringLiteral("hyde");
    const cr::GateEvaluation evaluation = orchestrator.recordAction(
        trail, params.strategyName, {}, 5, params, QStringLiteral("hyde generation failed: timeout"));

    QCOMPARE(evaluation.evidenceLevel, cr::EvidenceLevel::Insufficient);
    const cr::CorrectiveAction& action = trail.actions().front();
    QVERIFY(!action.success);
    QCOMPARE(action.error.value_or(QString()), QStringLiteral("hyde generation failed: timeout"));
    QCOMPARE(action.resultCount, 0);
}

void TestCorrectionOrchestrator::testRecordWeakAttemptNotSuccessful()
{
    const cr::CorrectionOrchestrator orchestrator;
    cr::AuditTrail trail = orchestrator.createAuditTrail(QStringLiteral("q"), makeResults({0.1}));

    cr::RetryParameters params;
    params.strategyName = QStringLiteral("aggressive_hybrid");
    const cr::GateEvaluation evaluation = orchestrator.recordAction(
        trail, params.strategyName, makeResults({0.3, 0.2}), 12, params);

    QCOMPARE(evaluation.evidenceLevel, cr::EvidenceLevel::Low);
    QVERIFY(!evaluation.gatePassed);

    // The attempt ran cleanly but the evidence is still weak.
    const cr::CorrectiveAction& action = trail.actions().front();
    QVERIFY(!action.success);
    QVERIFY(!action.error.has_value());
    QCOMPARE(action.resultCount, 2);
    QCOMPARE(action.bestScore, 0.3);
}

QTEST_MAIN(TestCorrectionOrchestrator)
#include "test_correction_orchestrator.moc"

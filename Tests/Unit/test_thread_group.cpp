#include <QtTest/QtTest>
#include "core/shared/thread_group.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

class TestThreadGroup : public QObject {
    Q_OBJECT

private slots:
    void testJoinAllWaitsForWorkers();
    void testDestructorJoinsDuringUnwinding();
    void testJoinAllIsRepeatable();
};

void TestThreadGroup::testJoinAllWaitsForWorkers()
{
    std::atomic<int> finished{0};
    cr::ThreadGroup group;
    group.reserve(3);
    for (int i = 0; i < 3; ++i) {
        group.spawn([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ++finished;
        });
    }
    QCOMPARE(static_cast<int>(group.size()), 3);

    group.joinAll();
    QCOMPARE(finished.load(), 3);
}

void TestThreadGroup::testDestructorJoinsDuringUnwinding()
{
    std::atomic<bool> workerDone{false};
    bool caught = false;
    try {
        cr::ThreadGroup group;
        group.spawn([&workerDone]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            workerDone = true;
        });
        throw std::runtime_error("second worker could not start");
    } catch (const std::runtime_error&) {
        caught = true;
        // The group was destroyed on the way out, so the worker has been joined.
        QVERIFY(workerDone.load());
    }
    QVERIFY(caught);
}

void TestThreadGroup::testJoinAllIsRepeatable()
{
    std::atomic<int> runs{0};
    cr::ThreadGroup group;
    group.spawn([&runs]() { ++runs; });
    group.joinAll();
    group.joinAll();
    QCOMPARE(runs.load(), 1);
}

QTEST_MAIN(TestThreadGroup)
#include "test_thread_group.moc"

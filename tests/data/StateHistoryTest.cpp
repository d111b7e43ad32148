#include <QtTest/QtTest>

#include "daytrack/data/StateHistory.hpp"

using namespace daytrack::data;
using namespace std::chrono_literals;

namespace {
const QDateTime T0(QDate(2024, 3, 4), QTime(9, 0));

QDateTime at(int minutes)
{
    return T0.addSecs(minutes * 60);
}
} // namespace

class StateHistoryTest : public QObject
{
    Q_OBJECT

private slots:
    void splitsTimeByState();
    void completedItemStopsAtCompletion();
    void outOfOrderEventsCountAsZero();
    void countsSessionsAndInterruptions();
    void calendarTimeNeedsBothEnds();
};

void StateHistoryTest::splitsTimeByState()
{
    const std::vector<StateEvent> history = {
        {at(0), std::nullopt, RunStatus::Idle},
        {at(10), RunStatus::Idle, RunStatus::Running},
        {at(40), RunStatus::Running, RunStatus::Paused},
        {at(50), RunStatus::Paused, RunStatus::Running},
    };

    const StateDurations durations = timeInEachState(history, at(70));
    QCOMPARE(durations.idle, Duration(10min));
    QCOMPARE(durations.running, Duration(50min));
    QCOMPARE(durations.paused, Duration(10min));
    QCOMPARE(durations.total(), Duration(70min));
}

void StateHistoryTest::completedItemStopsAtCompletion()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, at(0));
    item.start(at(0));
    item.markDone(at(20));

    QCOMPARE(runningTime(item, at(500)), Duration(20min));
    QCOMPARE(timeInEachState(item, at(500)).total(), Duration(20min));
}

void StateHistoryTest::outOfOrderEventsCountAsZero()
{
    const std::vector<StateEvent> history = {
        {at(30), std::nullopt, RunStatus::Running},
        {at(10), RunStatus::Running, RunStatus::Paused},
    };

    const StateDurations durations = timeInEachState(history, at(20));
    QCOMPARE(durations.running, Duration(0));
    QCOMPARE(durations.paused, Duration(10min));
}

void StateHistoryTest::countsSessionsAndInterruptions()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, at(0));
    item.start(at(1));
    item.pause(at(2));
    item.start(at(3));
    item.pause(at(4));
    item.setIdle(at(5));
    item.start(at(6));
    item.markDone(at(7));

    QCOMPARE(sessionCount(item), 3);
    QCOMPARE(interruptionCount(item), 2);
}

void StateHistoryTest::calendarTimeNeedsBothEnds()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, at(0));
    QVERIFY(!calendarTime(item).has_value());

    item.markDone(at(90));
    QVERIFY(calendarTime(item).has_value());
    QCOMPARE(*calendarTime(item), Duration(90min));
}

QTEST_GUILESS_MAIN(StateHistoryTest)
#include "StateHistoryTest.moc"

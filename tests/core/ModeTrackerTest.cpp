#include <QtTest/QtTest>

#include "daytrack/core/ModeTracker.hpp"
#include "daytrack/data/ItemTree.hpp"

using namespace daytrack;
using data::Duration;
using data::Item;
using data::LifeMode;
using data::RunStatus;
using namespace std::chrono_literals;

namespace {
const QDateTime T0(QDate(2024, 3, 4), QTime(9, 0));

QDateTime at(int minutes)
{
    return T0.addSecs(minutes * 60);
}

std::vector<Item> sampleItems()
{
    std::vector<Item> items;
    items.push_back(Item::create(QStringLiteral("Running"), 1h, T0));
    items.push_back(Item::create(QStringLiteral("Paused by hand"), 1h, T0));
    items.push_back(Item::create(QStringLiteral("Parent"), 1h, T0));
    items.back().addSubtask(Item::create(QStringLiteral("Child"), 1h, T0));

    items[0].start(T0);
    items[1].start(T0);
    items[1].pause(at(5));
    items[2].subtasks[0].start(T0);
    data::syncParentStatus(items[2], T0);
    return items;
}
} // namespace

class ModeTrackerTest : public QObject
{
    Q_OBJECT

private slots:
    void leavingWorkingPausesRunningItems();
    void returningToWorkingResumesRecordedItems();
    void switchingBetweenBreaksKeepsRecord();
    void sameModeIsNoop();
    void idledItemsStillResume();
    void resetCountersStartsFromZero();
    void accumulatesTimePerMode();
    void snapshotRestoreKeepsPausedItems();
};

void ModeTrackerTest::leavingWorkingPausesRunningItems()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();

    QVERIFY(tracker.switchTo(LifeMode::Lunch, items, at(10)));
    QVERIFY(!tracker.timersAllowed());
    QCOMPARE(items[0].status, RunStatus::Paused);
    QCOMPARE(items[2].status, RunStatus::Paused);
    QCOMPARE(items[2].subtasks[0].status, RunStatus::Paused);
    QCOMPARE(items[0].tracking.elapsed, Duration(10min));
    QCOMPARE(tracker.pausedByMode().size(), std::size_t(3));
}

void ModeTrackerTest::returningToWorkingResumesRecordedItems()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    tracker.switchTo(LifeMode::Lunch, items, at(10));

    QVERIFY(tracker.switchTo(LifeMode::Working, items, at(40)));
    QCOMPARE(items[0].status, RunStatus::Running);
    QCOMPARE(items[1].status, RunStatus::Paused);
    QCOMPARE(items[2].status, RunStatus::Running);
    QCOMPARE(items[2].subtasks[0].status, RunStatus::Running);
    QVERIFY(tracker.pausedByMode().empty());
}

void ModeTrackerTest::switchingBetweenBreaksKeepsRecord()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    tracker.switchTo(LifeMode::Lunch, items, at(10));
    tracker.switchTo(LifeMode::Gym, items, at(20));
    QCOMPARE(tracker.pausedByMode().size(), std::size_t(3));

    // An item finished while away is not resumed.
    items[0].markDone(at(25));
    tracker.switchTo(LifeMode::Working, items, at(30));
    QCOMPARE(items[0].status, RunStatus::Done);
    QCOMPARE(items[2].subtasks[0].status, RunStatus::Running);
}

void ModeTrackerTest::idledItemsStillResume()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    tracker.switchTo(LifeMode::Lunch, items, at(10));
    items[0].setIdle(at(15));

    tracker.switchTo(LifeMode::Working, items, at(30));
    QCOMPARE(items[0].status, RunStatus::Running);
    QCOMPARE(items[1].status, RunStatus::Paused);
}

void ModeTrackerTest::resetCountersStartsFromZero()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    tracker.switchTo(LifeMode::Gym, items, at(10));
    tracker.switchTo(LifeMode::Personal, items, at(40));
    tracker.switchTo(LifeMode::Gym, items, at(50));
    QCOMPARE(tracker.timeIn(LifeMode::Gym, at(60)), Duration(40min));
    QCOMPARE(tracker.timeIn(LifeMode::Personal, at(60)), Duration(10min));

    tracker.resetCounters(at(60));
    QCOMPARE(tracker.timeIn(LifeMode::Personal, at(90)), Duration(0));
    QCOMPARE(tracker.timeIn(LifeMode::Gym, at(90)), Duration(30min));
    QCOMPARE(tracker.mode(), LifeMode::Gym);
}

void ModeTrackerTest::sameModeIsNoop()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    QVERIFY(!tracker.switchTo(LifeMode::Working, items, at(10)));
    QCOMPARE(items[0].status, RunStatus::Running);
}

void ModeTrackerTest::accumulatesTimePerMode()
{
    core::ModeTracker tracker;
    std::vector<Item> items;
    data::Metadata metadata;
    tracker.restore(metadata, items, T0);

    tracker.switchTo(LifeMode::Break, items, at(50));
    tracker.switchTo(LifeMode::Working, items, at(60));
    tracker.switchTo(LifeMode::Break, items, at(90));

    QCOMPARE(tracker.timeIn(LifeMode::Working, at(100)), Duration(80min));
    QCOMPARE(tracker.timeIn(LifeMode::Break, at(100)), Duration(20min));
    QCOMPARE(tracker.timeIn(LifeMode::Sleep, at(100)), Duration(0));

    const data::Metadata snapshot = tracker.snapshot(items, at(100));
    QCOMPARE(snapshot.mode, LifeMode::Break);
    QCOMPARE(snapshot.secondsIn(LifeMode::Working), qint64(80 * 60));
    QCOMPARE(snapshot.lastModeChange, at(100));
}

void ModeTrackerTest::snapshotRestoreKeepsPausedItems()
{
    core::ModeTracker tracker;
    std::vector<Item> items = sampleItems();
    tracker.switchTo(LifeMode::Dinner, items, at(10));
    const data::Metadata metadata = tracker.snapshot(items, at(20));
    QCOMPARE(metadata.pausedByMode,
             QStringList({QStringLiteral("0:Running"), QStringLiteral("2:Parent"), QStringLiteral("2.0:Child")}));

    // Reloading gives every item a new id; durable keys still find them.
    std::vector<Item> reloaded = items;
    for (Item &item : reloaded) {
        item.id = QUuid::createUuid();
        for (Item &subtask : item.subtasks) {
            subtask.id = QUuid::createUuid();
        }
    }
    core::ModeTracker restored;
    restored.restore(metadata, reloaded, at(30));
    QCOMPARE(restored.mode(), LifeMode::Dinner);
    QCOMPARE(restored.pausedByMode().size(), std::size_t(3));

    restored.switchTo(LifeMode::Working, reloaded, at(40));
    QCOMPARE(reloaded[0].status, RunStatus::Running);
    QCOMPARE(reloaded[1].status, RunStatus::Paused);
    QCOMPARE(reloaded[2].subtasks[0].status, RunStatus::Running);
}

QTEST_GUILESS_MAIN(ModeTrackerTest)
#include "ModeTrackerTest.moc"

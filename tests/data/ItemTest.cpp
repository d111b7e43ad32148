#include <QtTest/QtTest>

#include "daytrack/data/Item.hpp"

using namespace daytrack::data;
using namespace std::chrono_literals;

namespace {
const QDateTime T0(QDate(2024, 3, 4), QTime(9, 0));
}

class ItemTest : public QObject
{
    Q_OBJECT

private slots:
    void startTickPause();
    void overEstimateOnlyWhileRunning();
    void transitionsAreRecorded();
    void markDoneTwiceKeepsFirstCompletion();
    void postponeReturnsToIdle();
    void estimateNeverNegative();
    void tagsAreTrimmedAndUnique();
    void tagsRejectCommas();
    void notesDropTrailingBlankLines();
    void subtasksAreOneLevelDeep();
    void coerceClosesOpenSpan();
    void coerceNeverRewindsHistory();
    void resyncIsIdempotent();
    void formatsDurations();
};

void ItemTest::startTickPause()
{
    Item item = Item::create(QStringLiteral("Foo"), 2h, T0);
    item.start(T0);
    item.tick(T0.addSecs(30 * 60));
    item.pause(T0.addSecs(30 * 60));

    QCOMPARE(item.tracking.elapsed, Duration(30min));
    QVERIFY(!item.isOverEstimate());
    QCOMPARE(item.status, RunStatus::Paused);
    QVERIFY(!item.tracking.isRunning());
}

void ItemTest::overEstimateOnlyWhileRunning()
{
    Item item = Item::create(QStringLiteral("Short"), 10min, T0);
    item.start(T0);
    item.tick(T0.addSecs(10 * 60));
    QVERIFY(item.isOverEstimate());

    item.pause(T0.addSecs(10 * 60));
    QVERIFY(!item.isOverEstimate());
}

void ItemTest::transitionsAreRecorded()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, T0);
    QCOMPARE(item.history.size(), std::size_t(1));
    QVERIFY(!item.history.front().from.has_value());
    QCOMPARE(item.history.front().to, RunStatus::Idle);

    item.toggleRunPause(T0.addSecs(60));
    item.toggleRunPause(T0.addSecs(120));
    QCOMPARE(item.history.size(), std::size_t(3));
    QCOMPARE(*item.history[1].from, RunStatus::Idle);
    QCOMPARE(item.history[1].to, RunStatus::Running);
    QCOMPARE(*item.history[2].from, RunStatus::Running);
    QCOMPARE(item.history[2].to, RunStatus::Paused);

    // Pausing an item that is not running changes nothing.
    item.pause(T0.addSecs(180));
    QCOMPARE(item.history.size(), std::size_t(3));
}

void ItemTest::markDoneTwiceKeepsFirstCompletion()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, T0);
    item.start(T0);
    item.markDone(T0.addSecs(600));
    item.markDone(T0.addSecs(1200));

    QCOMPARE(item.status, RunStatus::Done);
    QCOMPARE(item.completedAt, T0.addSecs(600));
    QCOMPARE(item.tracking.elapsed, Duration(10min));
    QCOMPARE(item.history.back().to, RunStatus::Done);
    QCOMPARE(item.history.size(), std::size_t(3));
}

void ItemTest::postponeReturnsToIdle()
{
    Item item = Item::create(QStringLiteral("Foo"), 1h, T0);
    item.start(T0);
    item.postpone(T0.addSecs(300));

    QCOMPARE(item.status, RunStatus::Idle);
    QCOMPARE(item.tracking.elapsed, Duration(5min));
    QVERIFY(!item.tracking.isRunning());
}

void ItemTest::estimateNeverNegative()
{
    Item item = Item::create(QStringLiteral("Foo"), 10min, T0);
    item.decreaseEstimate(15min);
    QCOMPARE(item.tracking.estimate, Duration(0));
    QCOMPARE(item.tracking.progressRatio(), 1.0);

    item.increaseEstimate(15min);
    QCOMPARE(item.tracking.estimate, Duration(15min));
}

void ItemTest::tagsAreTrimmedAndUnique()
{
    Item item;
    QVERIFY(item.addTag(QStringLiteral(" work ")));
    QVERIFY(!item.addTag(QStringLiteral("work")));
    QVERIFY(!item.addTag(QStringLiteral("   ")));
    item.setTags({QStringLiteral("a"), QStringLiteral(" b"), QStringLiteral("a")});
    QCOMPARE(item.tags, QStringList({QStringLiteral("a"), QStringLiteral("b")}));
    QVERIFY(item.removeTag(QStringLiteral("a")));
    QCOMPARE(item.tags, QStringList({QStringLiteral("b")}));
}

void ItemTest::tagsRejectCommas()
{
    Item item;
    QVERIFY(!item.addTag(QStringLiteral("home,garden")));
    item.setTags({QStringLiteral("a,b"), QStringLiteral("c")});
    QCOMPARE(item.tags, QStringList({QStringLiteral("c")}));
}

void ItemTest::notesDropTrailingBlankLines()
{
    Item item;
    item.setNotes(QStringLiteral("a\n"));
    QCOMPARE(item.notes, QStringLiteral("a"));
    item.setNotes(QStringLiteral("first\n\nsecond  \n\n  \n"));
    QCOMPARE(item.notes, QStringLiteral("first\n\nsecond"));
    item.setNotes(QStringLiteral(" \n"));
    QVERIFY(item.notes.isEmpty());
}

void ItemTest::subtasksAreOneLevelDeep()
{
    Item parent = Item::create(QStringLiteral("Parent"), 1h, T0);
    Item child = Item::create(QStringLiteral("Child"), 1h, T0);
    Item grandChild = Item::create(QStringLiteral("Grandchild"), 1h, T0);
    QVERIFY(child.addSubtask(grandChild));

    QVERIFY(!parent.addSubtask(child));
    QVERIFY(!parent.hasSubtasks());

    QVERIFY(parent.addSubtask(Item::create(QStringLiteral("Leaf"), 1h, T0)));
    QVERIFY(parent.hasSubtasks());
    QVERIFY(!parent.hasRunningSubtask());
    parent.subtasks.front().start(T0);
    QVERIFY(parent.hasRunningSubtask());
}

void ItemTest::coerceClosesOpenSpan()
{
    Item item = Item::create(QStringLiteral("Foo"), 2h, T0);
    item.start(T0);
    item.coerceRunningToPaused(T0.addSecs(3600));
    item.resyncElapsed(T0.addSecs(7200));

    QCOMPARE(item.status, RunStatus::Paused);
    QVERIFY(!item.tracking.isRunning());
    QCOMPARE(item.history.back().timestamp, T0.addSecs(3600));
    QCOMPARE(*item.history.back().from, RunStatus::Running);
    QCOMPARE(item.history.back().to, RunStatus::Paused);
    QCOMPARE(item.tracking.elapsed, Duration(1h));
}

void ItemTest::coerceNeverRewindsHistory()
{
    Item item = Item::create(QStringLiteral("Foo"), 2h, T0);
    item.start(T0.addSecs(600));
    item.coerceRunningToPaused(T0);

    QCOMPARE(item.history.back().timestamp, T0.addSecs(600));
    item.resyncElapsed(T0.addSecs(3600));
    QCOMPARE(item.tracking.elapsed, Duration(0));
}

void ItemTest::resyncIsIdempotent()
{
    Item item = Item::create(QStringLiteral("Foo"), 2h, T0);
    item.start(T0);
    item.pause(T0.addSecs(1800));
    item.start(T0.addSecs(3600));
    item.coerceRunningToPaused(T0.addSecs(4500));

    const QDateTime now = T0.addSecs(9000);
    item.resyncElapsed(now);
    const Duration first = item.tracking.elapsed;
    const std::size_t events = item.history.size();
    item.coerceRunningToPaused(now);
    item.resyncElapsed(now);

    QCOMPARE(first, Duration(45min));
    QCOMPARE(item.tracking.elapsed, first);
    QCOMPARE(item.history.size(), events);
}

void ItemTest::formatsDurations()
{
    QCOMPARE(formatDuration(90min), QStringLiteral("1h 30m"));
    QCOMPARE(formatDuration(2h), QStringLiteral("2h"));
    QCOMPARE(formatDuration(45min), QStringLiteral("45m"));
    QCOMPARE(formatDuration(Duration(0)), QStringLiteral("0m"));
}

QTEST_GUILESS_MAIN(ItemTest)
#include "ItemTest.moc"

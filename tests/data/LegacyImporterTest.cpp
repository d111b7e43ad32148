#include <QtTest/QtTest>

#include "daytrack/data/DailyFileCodec.hpp"
#include "daytrack/data/DataDirectory.hpp"
#include "daytrack/data/DoneLogReader.hpp"
#include "daytrack/data/FileDayRepository.hpp"
#include "daytrack/data/LegacyImporter.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

using namespace daytrack::data;
using namespace std::chrono_literals;

class LegacyImporterTest : public QObject
{
    Q_OBJECT

private slots:
    void importsLegacyFilesOnce();
    void nothingToImport();
    void ignoresOtherDaysInDoneLog();
};

void LegacyImporterTest::importsLegacyFilesOnce()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const DataDirectory directory(dir.path());
    FileDayRepository repository(directory);
    const QDateTime now = QDateTime::currentDateTime();
    const QDate today = now.date();

    QVERIFY(DataDirectory::writeAtomically(directory.legacyTodayFile(),
                                           QStringLiteral("## ACTIVE\n- [IDLE] Plan\n  est: 1.00h\n"
                                                          "- [DONE] Stale\n")));
    QVERIFY(DataDirectory::writeAtomically(directory.legacyTomorrowFile(),
                                           QStringLiteral("- [PAUSED] Follow up\n  est: 0.50h\n  elapsed: 0.25h\n")));
    QVERIFY(DataDirectory::writeAtomically(directory.legacyDoneLogFile(),
                                           QStringLiteral("## %1\nTask: \"Email\"\nElapsed: 0.25h\n"
                                                          "Estimate at finish: 0.50h\nTags: inbox, admin\n"
                                                          "Notes:\nanswered everything\n")
                                               .arg(DailyFileCodec::formatTimestamp(now.addSecs(-60)))));

    LegacyImporter importer(directory, repository);
    QVERIFY(importer.hasLegacyData());

    QString error;
    const std::optional<int> imported = importer.run(today, now, &error);
    QVERIFY2(imported.has_value(), qPrintable(error));
    QCOMPARE(*imported, 4);

    const std::optional<DayLists> lists = repository.loadDay(today, ScheduleDay::Today);
    QCOMPARE(lists->active.size(), std::size_t(2));
    QCOMPARE(lists->active[0].title, QStringLiteral("Plan"));
    QCOMPARE(lists->active[1].title, QStringLiteral("Follow up"));
    QCOMPARE(lists->active[1].status, RunStatus::Paused);
    QCOMPARE(lists->done.size(), std::size_t(2));
    QCOMPARE(lists->done[1].title, QStringLiteral("Email"));
    QCOMPARE(lists->done[1].tags, QStringList({QStringLiteral("inbox"), QStringLiteral("admin")}));
    QCOMPARE(lists->done[1].notes, QStringLiteral("answered everything"));
    QCOMPARE(lists->done[1].tracking.elapsed, Duration(15min));

    QVERIFY(!QFile::exists(directory.legacyTodayFile()));
    QCOMPARE(QFileInfo(directory.legacyTomorrowFile()).size(), qint64(0));
    QVERIFY(!QFile::exists(directory.legacyDoneLogFile()));
    QCOMPARE(QDir(dir.path()).entryList({QStringLiteral("done.log.md.*.bak")}, QDir::Files).size(), 1);

    QVERIFY(!importer.hasLegacyData());
    QCOMPARE(*importer.run(today, now), 0);
    QCOMPARE(repository.loadDay(today, ScheduleDay::Today)->active.size(), std::size_t(2));
}

void LegacyImporterTest::nothingToImport()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const DataDirectory directory(dir.path());
    FileDayRepository repository(directory);
    LegacyImporter importer(directory, repository);

    QVERIFY(!importer.hasLegacyData());
    QCOMPARE(*importer.run(QDate::currentDate(), QDateTime::currentDateTime()), 0);
    QVERIFY(directory.dailyFiles().empty());
}

void LegacyImporterTest::ignoresOtherDaysInDoneLog()
{
    const QDate day(2024, 3, 4);
    const QString log = QStringLiteral("## 2024-03-03T17:00:00\nTask: \"Yesterday\"\n\n"
                                       "## 2024-03-04T10:00:00\nTask: \"Today\"\nHistory:\n"
                                       "  - 2024-03-04T09:00:00: IDLE\n"
                                       "  - 2024-03-04T09:10:00: IDLE -> RUNNING\n\n"
                                       "## 2024-03-04T11:00:00\nElapsed: 1.00h\n");
    const std::vector<Item> items = readDoneLog(log, day);

    QCOMPARE(items.size(), std::size_t(1));
    const Item &item = items.front();
    QCOMPARE(item.title, QStringLiteral("Today"));
    QCOMPARE(item.status, RunStatus::Done);
    QCOMPARE(item.createdAt, QDateTime(day, QTime(9, 0)));
    QCOMPARE(item.completedAt, QDateTime(day, QTime(10, 0)));
    QCOMPARE(item.history.size(), std::size_t(3));
    QCOMPARE(*item.history.back().from, RunStatus::Running);
    QCOMPARE(item.history.back().to, RunStatus::Done);
}

QTEST_GUILESS_MAIN(LegacyImporterTest)
#include "LegacyImporterTest.moc"

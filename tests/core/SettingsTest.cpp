#include <QtTest/QtTest>

#include "daytrack/core/Settings.hpp"

#include <QSettings>
#include <QTemporaryDir>

using daytrack::core::Settings;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void valuesAreClamped();
    void saveThenLoad();
};

void SettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings stored(dir.filePath(QStringLiteral("daytrack.ini")), QSettings::IniFormat);

    const Settings settings = Settings::load(stored);
    QCOMPARE(settings.tickIntervalMs, 250);
    QCOMPARE(settings.idleCheckMinutes, 30);
    QCOMPARE(settings.idleGraceMinutes, 30);
    QCOMPARE(settings.undoLimit, 10);
    QVERIFY(settings.dataDirectory.isEmpty());
}

void SettingsTest::valuesAreClamped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings stored(dir.filePath(QStringLiteral("daytrack.ini")), QSettings::IniFormat);
    stored.setValue(QStringLiteral("timing/tickIntervalMs"), 1);
    stored.setValue(QStringLiteral("timing/idleCheckMinutes"), 100000);
    stored.setValue(QStringLiteral("undo/limit"), QStringLiteral("lots"));

    const Settings settings = Settings::load(stored);
    QCOMPARE(settings.tickIntervalMs, 50);
    QCOMPARE(settings.idleCheckMinutes, 24 * 60);
    QCOMPARE(settings.undoLimit, 10);
}

void SettingsTest::saveThenLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings stored(dir.filePath(QStringLiteral("daytrack.ini")), QSettings::IniFormat);

    Settings settings;
    settings.idleGraceMinutes = 5;
    settings.estimateStepMinutes = 10;
    settings.dataDirectory = dir.filePath(QStringLiteral("data"));
    settings.save(stored);
    stored.sync();

    const Settings loaded = Settings::load(stored);
    QCOMPARE(loaded.idleGraceMinutes, 5);
    QCOMPARE(loaded.estimateStepMinutes, 10);
    QCOMPARE(loaded.dataDirectory, settings.dataDirectory);
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"

#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "planner/core/RecurrenceSettings.hpp"

using namespace planner::core;

class RecurrenceSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void readsStoredValues();
    void ignoresInvalidValues();
    void saveThenLoad();
};

void RecurrenceSettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath(QStringLiteral("planner.ini")), QSettings::IniFormat);

    const RecurrenceSettings settings = RecurrenceSettings::load(store);
    QCOMPARE(settings.windowSafetyCap, 200);
    QCOMPARE(settings.ordinalSafetyCap, 502);
    QCOMPARE(settings.defaultGenerationCount, 50);
    QCOMPARE(settings.previewDefaultCount, 5);
    QCOMPARE(settings.previewMaxCount, 200);
    QCOMPARE(settings.previewStepCap, 2000);
    QCOMPARE(settings.trimHorizonYears, 3);
    QCOMPARE(settings.trimMinInstances, 24);
    QVERIFY(settings.storagePath.isEmpty());
    QVERIFY(settings.loggingRules.isEmpty());
}

void RecurrenceSettingsTest::readsStoredValues()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath(QStringLiteral("planner.ini")), QSettings::IniFormat);
    store.setValue(QStringLiteral("recurrence/windowSafetyCap"), 120);
    store.setValue(QStringLiteral("recurrence/trimHorizonYears"), QStringLiteral("5"));
    store.setValue(QStringLiteral("storage/path"), QStringLiteral("/srv/planner/jobs.ics"));
    store.setValue(QStringLiteral("logging/rules"), QStringLiteral("planner.*.debug=true"));

    const RecurrenceSettings settings = RecurrenceSettings::load(store);
    QCOMPARE(settings.windowSafetyCap, 120);
    QCOMPARE(settings.trimHorizonYears, 5);
    QCOMPARE(settings.storagePath, QStringLiteral("/srv/planner/jobs.ics"));
    QCOMPARE(settings.loggingRules, QStringLiteral("planner.*.debug=true"));
}

void RecurrenceSettingsTest::ignoresInvalidValues()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath(QStringLiteral("planner.ini")), QSettings::IniFormat);
    store.setValue(QStringLiteral("recurrence/previewMaxCount"), 0);
    store.setValue(QStringLiteral("recurrence/defaultGenerationCount"), -4);
    store.setValue(QStringLiteral("recurrence/ordinalSafetyCap"), QStringLiteral("lots"));

    const RecurrenceSettings settings = RecurrenceSettings::load(store);
    QCOMPARE(settings.previewMaxCount, 200);
    QCOMPARE(settings.defaultGenerationCount, 50);
    QCOMPARE(settings.ordinalSafetyCap, 502);
}

void RecurrenceSettingsTest::saveThenLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.ini"));

    RecurrenceSettings settings;
    settings.previewDefaultCount = 8;
    settings.trimMinInstances = 12;
    settings.storagePath = dir.filePath(QStringLiteral("jobs.ics"));
    {
        QSettings store(path, QSettings::IniFormat);
        settings.save(store);
        store.sync();
        QCOMPARE(store.status(), QSettings::NoError);
    }

    QSettings store(path, QSettings::IniFormat);
    const RecurrenceSettings loaded = RecurrenceSettings::load(store);
    QCOMPARE(loaded.previewDefaultCount, 8);
    QCOMPARE(loaded.trimMinInstances, 12);
    QCOMPARE(loaded.storagePath, settings.storagePath);
    QVERIFY(!store.contains(QStringLiteral("logging/rules")));
}

QTEST_GUILESS_MAIN(RecurrenceSettingsTest)
#include "RecurrenceSettingsTest.moc"

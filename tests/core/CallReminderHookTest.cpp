#include <QtTest/QtTest>

#include "planner/core/CallReminderHook.hpp"
#include "planner/data/InMemoryOccurrenceRepository.hpp"
#include "planner/recurrence/SeriesGenerator.hpp"

using namespace planner;

class CallReminderHookTest : public QObject
{
    Q_OBJECT

private slots:
    void reminderSunday_data();
    void reminderSunday();
    void createsReminderPerInstance();
    void skipsDisabledReminders();
    void missingOccurrenceAbortsBatch();
};

void CallReminderHookTest::reminderSunday_data()
{
    QTest::addColumn<QDate>("start");
    QTest::addColumn<int>("weeksPrior");
    QTest::addColumn<QDate>("expected");

    QTest::newRow("wednesday") << QDate(2024, 5, 15) << 1 << QDate(2024, 5, 12);
    QTest::newRow("sunday") << QDate(2024, 5, 12) << 1 << QDate(2024, 5, 12);
    QTest::newRow("saturday") << QDate(2024, 5, 18) << 1 << QDate(2024, 5, 12);
    QTest::newRow("two weeks") << QDate(2024, 5, 15) << 2 << QDate(2024, 5, 5);
    QTest::newRow("across month") << QDate(2024, 6, 3) << 3 << QDate(2024, 5, 19);
}

void CallReminderHookTest::reminderSunday()
{
    QFETCH(QDate, start);
    QFETCH(int, weeksPrior);
    QFETCH(QDate, expected);

    QCOMPARE(core::callReminderSunday(QDateTime(start, QTime(9, 0)), weeksPrior), expected);
}

void CallReminderHookTest::createsReminderPerInstance()
{
    data::InMemoryOccurrenceRepository repo;
    data::Occurrence parent;
    parent.calendar = QStringLiteral("Yard");
    parent.start = QDateTime(QDate(2024, 5, 15), QTime(9, 0));
    parent.end = parent.start.addSecs(3600);
    parent.callReminder.enabled = true;
    parent.callReminder.weeksPrior = 2;
    data::RecurrenceRule rule;
    rule.count = 3;
    parent.rule = rule;
    QVERIFY(repo.insert(parent) == data::StoreStatus::Ok);

    core::CallReminderHook hook;
    recurrence::SeriesGenerator generator(repo, &hook);
    const auto created = generator.createInstances(parent);
    QVERIFY(created.has_value());
    QCOMPARE(int(created->size()), 3);

    for (const auto &instance : *created) {
        const auto reminders = repo.remindersFor(instance.id);
        QCOMPARE(int(reminders.size()), 1);
        QCOMPARE(reminders.front().calendar, QStringLiteral("Yard"));
        QCOMPARE(reminders.front().reminderDate, core::callReminderSunday(instance.start, 2));
        QVERIFY(!reminders.front().completed);
    }
    QVERIFY(repo.remindersFor(parent.id).empty());
}

void CallReminderHookTest::skipsDisabledReminders()
{
    data::InMemoryOccurrenceRepository repo;
    data::Occurrence instance;
    instance.start = QDateTime(QDate(2024, 5, 15), QTime(9, 0));
    instance.callReminder.enabled = true;
    instance.callReminder.weeksPrior = 0;
    QVERIFY(repo.insert(instance) == data::StoreStatus::Ok);

    core::CallReminderHook hook;
    QVERIFY(hook.onInstanceCreated(instance, repo));
    instance.callReminder.enabled = false;
    instance.callReminder.weeksPrior = 1;
    QVERIFY(hook.onInstanceCreated(instance, repo));
    QVERIFY(repo.remindersFor(instance.id).empty());
}

void CallReminderHookTest::missingOccurrenceAbortsBatch()
{
    data::InMemoryOccurrenceRepository repo;
    data::Occurrence unsaved;
    unsaved.start = QDateTime(QDate(2024, 5, 15), QTime(9, 0));
    unsaved.callReminder.enabled = true;
    unsaved.callReminder.weeksPrior = 1;

    core::CallReminderHook hook;
    QVERIFY(!hook.onInstanceCreated(unsaved, repo));
}

QTEST_GUILESS_MAIN(CallReminderHookTest)
#include "CallReminderHookTest.moc"

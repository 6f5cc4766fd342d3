#include <QtTest/QtTest>

#include "planner/core/CallReminderHook.hpp"
#include "planner/core/SeriesService.hpp"
#include "planner/data/InMemoryOccurrenceRepository.hpp"

using namespace planner;

namespace {

data::Occurrence makeJob(const QDateTime &start, std::optional<data::RecurrenceRule> rule)
{
    data::Occurrence job;
    job.calendar = QStringLiteral("Yard");
    job.start = start;
    job.end = start.addSecs(3600);
    job.snapshot.businessName = QStringLiteral("Creek Lodge");
    job.rule = std::move(rule);
    return job;
}

data::RecurrenceRule forever()
{
    data::RecurrenceRule rule;
    rule.endNever = true;
    return rule;
}

data::RecurrenceRule weeklyCount(int count)
{
    data::RecurrenceRule rule;
    rule.count = count;
    return rule;
}

} // namespace

class SeriesServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void createsFiniteSeries();
    void foreverSeriesStoresOnlyParent();
    void rejectsInvalidSeries();
    void windowMixesStoredAndVirtual();
    void windowSkipsMaterializedSlots();
    void previewListsUpcoming();
    void previewRejectsFiniteSeries();
    void previewStopsAtStepCap();
    void ordinalAndSummary();
    void cancelFutureFromInstance();
    void deleteAndTrimDelegate();
};

void SeriesServiceTest::createsFiniteSeries()
{
    data::InMemoryOccurrenceRepository repo;
    core::CallReminderHook hook;
    core::SeriesService service(repo, core::RecurrenceSettings{}, &hook);

    data::Occurrence job = makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), weeklyCount(3));
    job.callReminder.enabled = true;
    job.callReminder.weeksPrior = 1;
    const auto result = service.createSeries(job);
    QVERIFY(result.ok());
    QCOMPARE(int(result.instances.size()), 3);
    QVERIFY(repo.findById(result.parent->id).has_value());
    QCOMPARE(int(repo.instancesOf(result.parent->id).size()), 3);
    QCOMPARE(int(repo.remindersFor(result.instances.front().id).size()), 1);
}

void SeriesServiceTest::foreverSeriesStoresOnlyParent()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});

    const auto result = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), forever()));
    QVERIFY(result.ok());
    QVERIFY(result.instances.empty());
    QVERIFY(repo.instancesOf(result.parent->id).empty());

    const auto single = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 2), QTime(9, 0)), std::nullopt));
    QVERIFY(single.ok());
    QVERIFY(!single.parent->isSeriesParent());
}

void SeriesServiceTest::rejectsInvalidSeries()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});

    data::Occurrence child = makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), std::nullopt);
    child.parentId = QUuid::createUuid();
    child.originalAnchor = child.start;
    QVERIFY(!service.createSeries(child).ok());

    data::RecurrenceRule broken;
    broken.interval = 0;
    QVERIFY(!service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), broken)).ok());

    QVERIFY(!service.createSeries(makeJob(QDateTime(), std::nullopt)).ok());
    QVERIFY(repo.fetchOccurrences(QDate(2000, 1, 1), QDate(2100, 1, 1)).empty());
}

void SeriesServiceTest::windowMixesStoredAndVirtual()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto endless = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), forever()));
    const auto finite = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 3), QTime(14, 0)), weeklyCount(2)));
    QVERIFY(endless.ok());
    QVERIFY(finite.ok());

    const auto entries = service.occurrencesInWindow(QDate(2024, 1, 1), QDate(2024, 1, 14));
    // Stored: endless parent, finite parent, finite 01-10. Virtual: 01-08.
    QCOMPARE(int(entries.size()), 4);

    QCOMPARE(entries.at(0).occurrence.id, endless.parent->id);
    QVERIFY(!entries.at(0).isVirtual);
    QCOMPARE(entries.at(0).ordinal, std::optional<int>(1));

    QCOMPARE(entries.at(1).occurrence.id, finite.parent->id);

    QVERIFY(entries.at(2).isVirtual);
    QVERIFY(entries.at(2).occurrence.id.isNull());
    QCOMPARE(entries.at(2).occurrence.parentId, endless.parent->id);
    QCOMPARE(entries.at(2).occurrence.start, QDateTime(QDate(2024, 1, 8), QTime(9, 0)));
    QCOMPARE(entries.at(2).ordinal, std::optional<int>(2));
    QCOMPARE(entries.at(2).occurrence.snapshot.businessName, QStringLiteral("Creek Lodge"));

    QVERIFY(!entries.at(3).isVirtual);
    QCOMPARE(entries.at(3).occurrence.parentId, finite.parent->id);
    QCOMPARE(entries.at(3).ordinal, std::optional<int>(2));
}

void SeriesServiceTest::windowSkipsMaterializedSlots()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto endless = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), forever()));
    QVERIFY(endless.ok());

    const auto moved = service.materialize(endless.parent->id, QDateTime(QDate(2024, 1, 8), QTime(9, 0)));
    QVERIFY(moved.wasCreated);
    data::Occurrence instance = *moved.occurrence;
    instance.start = instance.start.addDays(1);
    instance.end = instance.end.addDays(1);
    QVERIFY(repo.update(instance) == data::StoreStatus::Ok);

    const auto removed = service.materialize(endless.parent->id, QDateTime(QDate(2024, 1, 15), QTime(9, 0)));
    QVERIFY(removed.wasCreated);
    QVERIFY(service.deleteOccurrence(removed.occurrence->id, recurrence::DeleteScope::ThisOnly).ok);

    const auto entries = service.occurrencesInWindow(QDate(2024, 1, 7), QDate(2024, 1, 22));
    QCOMPARE(int(entries.size()), 2);
    QCOMPARE(entries.at(0).occurrence.id, instance.id);
    QCOMPARE(entries.at(0).ordinal, std::optional<int>(2));
    QVERIFY(entries.at(1).isVirtual);
    QCOMPARE(entries.at(1).occurrence.start.date(), QDate(2024, 1, 22));
    QCOMPARE(entries.at(1).ordinal, std::optional<int>(4));
}

void SeriesServiceTest::previewListsUpcoming()
{
    data::InMemoryOccurrenceRepository repo;
    core::RecurrenceSettings settings;
    settings.previewMaxCount = 3;
    core::SeriesService service(repo, settings);
    const auto endless = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), forever()));
    QVERIFY(endless.ok());
    QVERIFY(service.materialize(endless.parent->id, QDateTime(QDate(2024, 1, 15), QTime(9, 0))).ok());

    const auto preview = service.preview(endless.parent->id, QDate(2024, 1, 1), 2);
    QVERIFY(preview.ok());
    QCOMPARE(int(preview.occurrences.size()), 2);
    QVERIFY(preview.hasMore);
    QCOMPARE(preview.occurrences.at(0).start.date(), QDate(2024, 1, 8));
    QCOMPARE(preview.occurrences.at(1).start.date(), QDate(2024, 1, 22));
    QCOMPARE(preview.occurrences.at(1).ordinal, 3);

    QCOMPARE(int(service.preview(endless.parent->id, QDate(2024, 1, 1), 50).occurrences.size()), 3);
    QCOMPARE(int(service.preview(endless.parent->id, QDate(2024, 1, 1)).occurrences.size()), 5);
    QCOMPARE(service.preview(endless.parent->id, QDate(2024, 1, 22), 1).occurrences.front().start.date(),
             QDate(2024, 1, 29));

    QVERIFY(service.cancelFuture(endless.parent->id, QDate(2024, 1, 29)).ok);
    const auto ended = service.preview(endless.parent->id, QDate(2024, 1, 1), 3);
    QVERIFY(ended.ok());
    QCOMPARE(int(ended.occurrences.size()), 3);
    QCOMPARE(ended.occurrences.back().start.date(), QDate(2024, 1, 29));
    QVERIFY(!ended.hasMore);
}

void SeriesServiceTest::previewRejectsFiniteSeries()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto finite = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), weeklyCount(2)));
    QVERIFY(finite.ok());

    QVERIFY(!service.preview(finite.parent->id, QDate(2024, 1, 1)).ok());
    QVERIFY(!service.preview(finite.instances.front().id, QDate(2024, 1, 1)).ok());
    QVERIFY(!service.preview(QUuid::createUuid(), QDate(2024, 1, 1)).ok());
}

void SeriesServiceTest::previewStopsAtStepCap()
{
    data::InMemoryOccurrenceRepository repo;
    core::RecurrenceSettings settings;
    settings.previewStepCap = 100;
    core::SeriesService service(repo, settings);
    data::RecurrenceRule daily = forever();
    daily.frequency = data::Daily{};
    const auto endless = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), daily));
    QVERIFY(endless.ok());

    const auto near = service.preview(endless.parent->id, QDate(2024, 3, 1));
    QVERIFY(near.ok());
    QCOMPARE(int(near.occurrences.size()), 5);
    QCOMPARE(near.occurrences.front().start.date(), QDate(2024, 3, 2));

    const auto far = service.preview(endless.parent->id, QDate(2100, 1, 1));
    QVERIFY(far.ok());
    QVERIFY(far.occurrences.empty());
    QVERIFY(far.hasMore);
}

void SeriesServiceTest::ordinalAndSummary()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto finite = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), weeklyCount(4)));
    QVERIFY(finite.ok());

    QCOMPARE(service.ordinal(finite.parent->id), std::optional<int>(1));
    QCOMPARE(service.ordinal(finite.instances.at(2).id), std::optional<int>(4));
    QVERIFY(!service.ordinal(QUuid::createUuid()).has_value());

    const auto text = service.summary(finite.parent->id);
    QVERIFY(text.has_value());
    QVERIFY(text->startsWith(QStringLiteral("Repeats weekly")));
    QVERIFY(text->endsWith(QStringLiteral("5 occurrences")));
    QVERIFY(!service.summary(finite.instances.front().id).has_value());
}

void SeriesServiceTest::cancelFutureFromInstance()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto finite = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), weeklyCount(4)));
    QVERIFY(finite.ok());

    const auto result = service.cancelFuture(finite.instances.at(1).id, QDate(2024, 1, 15));
    QVERIFY(result.ok);
    QCOMPARE(result.affected, 3);
    QCOMPARE(repo.findById(finite.parent->id)->seriesEndOverride, std::optional<QDate>(QDate(2024, 1, 15)));
    QVERIFY(!service.cancelFuture(QUuid::createUuid(), QDate(2024, 1, 15)).ok);
}

void SeriesServiceTest::deleteAndTrimDelegate()
{
    data::InMemoryOccurrenceRepository repo;
    core::SeriesService service(repo, core::RecurrenceSettings{});
    const auto finite = service.createSeries(makeJob(QDateTime(QDate(2024, 1, 1), QTime(9, 0)), weeklyCount(30)));
    QVERIFY(finite.ok());

    recurrence::TrimOptions options;
    options.horizonYears = 0;
    const auto report = service.trim(options, QDate(2024, 3, 1));
    QCOMPARE(report.instancesTrimmed, 22);

    data::JobSnapshot snapshot = finite.parent->snapshot;
    snapshot.city = QStringLiteral("Fairview");
    QCOMPARE(service.updateInstances(finite.parent->id, snapshot).affected, 8);

    QVERIFY(service.changeRule(finite.parent->id, weeklyCount(2)).ok);
    QCOMPARE(int(repo.instancesOf(finite.parent->id).size()), 2);

    const auto deleted = service.deleteOccurrence(finite.parent->id, recurrence::DeleteScope::All);
    QVERIFY(deleted.ok);
    QCOMPARE(deleted.affected, 3);
    QVERIFY(service.occurrencesInWindow(QDate(2024, 1, 1), QDate(2024, 12, 31)).empty());
}

QTEST_GUILESS_MAIN(SeriesServiceTest)
#include "SeriesServiceTest.moc"

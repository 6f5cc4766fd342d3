#include <QtTest/QtTest>

#include "planner/recurrence/WindowExpander.hpp"

using namespace planner::data;
using namespace planner::recurrence;

namespace {

Occurrence weeklyParent(RecurrenceRule rule = RecurrenceRule{})
{
    Occurrence parent;
    parent.start = QDateTime(QDate(2024, 1, 1), QTime(10, 0));
    parent.end = parent.start.addSecs(90 * 60);
    parent.rule = std::move(rule);
    return parent;
}

} // namespace

class WindowExpanderTest : public QObject
{
    Q_OBJECT

private slots:
    void weeklyOverThirtyDays();
    void windowAfterParent();
    void windowEndIsInclusive();
    void truncatesAtSafetyCap();
    void clampsToCutoff();
    void finiteCountLimitsSteps();
};

void WindowExpanderTest::weeklyOverThirtyDays()
{
    const Occurrence parent = weeklyParent();
    const QDate windowStart(2024, 1, 1);
    const QDate windowEnd = windowStart.addDays(29);

    const auto occurrences = WindowExpander::expand(parent, *parent.rule, windowStart, windowEnd);
    QVERIFY(occurrences.size() >= 4 && occurrences.size() <= 5);
    QVERIFY(occurrences.front().isParent);
    QCOMPARE(occurrences.front().ordinal, 0);

    QDateTime previous;
    for (size_t i = 0; i < occurrences.size(); ++i) {
        const auto &occurrence = occurrences[i];
        QVERIFY(occurrence.start.date() >= windowStart);
        QVERIFY(occurrence.start.date() <= windowEnd);
        QVERIFY(!previous.isValid() || previous <= occurrence.start);
        QCOMPARE(occurrence.ordinal, static_cast<int>(i));
        QCOMPARE(occurrence.parentId, parent.id);
        QCOMPARE(occurrence.start.secsTo(occurrence.end), qint64(90 * 60));
        previous = occurrence.start;
    }
}

void WindowExpanderTest::windowAfterParent()
{
    const Occurrence parent = weeklyParent();

    const auto occurrences = WindowExpander::expand(parent, *parent.rule, QDate(2024, 2, 1), QDate(2024, 2, 29));
    QCOMPARE(int(occurrences.size()), 4);
    QCOMPARE(occurrences.front().start.date(), QDate(2024, 2, 5));
    QCOMPARE(occurrences.front().ordinal, 5);
    QCOMPARE(occurrences.back().start.date(), QDate(2024, 2, 26));
    for (const auto &occurrence : occurrences) {
        QVERIFY(!occurrence.isParent);
        QCOMPARE(occurrence.originalAnchor, occurrence.start);
    }
}

void WindowExpanderTest::windowEndIsInclusive()
{
    const Occurrence parent = weeklyParent();

    const auto occurrences = WindowExpander::expand(parent, *parent.rule, QDate(2024, 1, 8), QDate(2024, 1, 8));
    QCOMPARE(int(occurrences.size()), 1);
    QCOMPARE(occurrences.front().ordinal, 1);

    QVERIFY(WindowExpander::expand(parent, *parent.rule, QDate(2024, 1, 9), QDate(2024, 1, 14)).empty());
}

void WindowExpanderTest::truncatesAtSafetyCap()
{
    RecurrenceRule daily;
    daily.frequency = Daily{};
    const Occurrence parent = weeklyParent(daily);

    const auto capped = WindowExpander::expand(parent, daily, QDate(2024, 1, 1), QDate(2024, 12, 31), 10);
    QCOMPARE(int(capped.size()), 10);
    QCOMPARE(capped.back().start.date(), QDate(2024, 1, 10));

    const auto defaults = WindowExpander::expand(parent, daily, QDate(2024, 1, 1), QDate(2025, 12, 31));
    QCOMPARE(int(defaults.size()), WindowExpander::kDefaultSafetyCap);
}

void WindowExpanderTest::clampsToCutoff()
{
    Occurrence parent = weeklyParent();
    parent.seriesEndOverride = QDate(2024, 1, 16);

    const auto occurrences = WindowExpander::expand(parent, *parent.rule, QDate(2024, 1, 1), QDate(2024, 1, 31));
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(occurrences.back().start.date(), QDate(2024, 1, 15));

    QVERIFY(WindowExpander::expand(parent, *parent.rule, QDate(2024, 2, 1), QDate(2024, 2, 29)).empty());
}

void WindowExpanderTest::finiteCountLimitsSteps()
{
    RecurrenceRule rule;
    rule.count = 2;
    const Occurrence parent = weeklyParent(rule);

    const auto occurrences = WindowExpander::expand(parent, rule, QDate(2024, 1, 1), QDate(2024, 3, 31));
    QCOMPARE(int(occurrences.size()), 3);
    QCOMPARE(occurrences.back().start.date(), QDate(2024, 1, 15));
}

QTEST_GUILESS_MAIN(WindowExpanderTest)
#include "WindowExpanderTest.moc"

#include <QtTest/QtTest>

#include "planner/recurrence/RuleEvaluator.hpp"

using namespace planner::data;
using namespace planner::recurrence;

class RuleEvaluatorTest : public QObject
{
    Q_OBJECT

private slots:
    void classifiesForever();
    void cutoffIsEarliestEnd();
    void pastCutoffComparesDates();
    void summaryText();
    void anchorAtOrdinal();
    void rejectsZeroInterval();
};

void RuleEvaluatorTest::classifiesForever()
{
    RecurrenceRule explicitNever;
    explicitNever.endNever = true;
    QVERIFY(isForever(explicitNever));

    RecurrenceRule implicit;
    QVERIFY(isForever(implicit));

    RecurrenceRule counted;
    counted.count = 12;
    QVERIFY(!isForever(counted));

    RecurrenceRule until;
    until.untilDate = QDate(2024, 12, 31);
    QVERIFY(!isForever(until));

    counted.endNever = true;
    QVERIFY(isForever(counted));
}

void RuleEvaluatorTest::cutoffIsEarliestEnd()
{
    RecurrenceRule rule;
    rule.untilDate = QDate(2024, 6, 30);

    QCOMPARE(effectiveCutoff(rule, std::nullopt), std::optional<QDate>(QDate(2024, 6, 30)));
    QCOMPARE(effectiveCutoff(rule, QDate(2024, 5, 31)), std::optional<QDate>(QDate(2024, 5, 31)));
    QCOMPARE(effectiveCutoff(rule, QDate(2024, 7, 31)), std::optional<QDate>(QDate(2024, 6, 30)));

    RecurrenceRule forever;
    QVERIFY(!effectiveCutoff(forever, std::nullopt).has_value());
    QCOMPARE(effectiveCutoff(forever, QDate(2024, 2, 1)), std::optional<QDate>(QDate(2024, 2, 1)));
}

void RuleEvaluatorTest::pastCutoffComparesDates()
{
    RecurrenceRule rule;
    rule.untilDate = QDate(2024, 6, 30);
    const RuleEvaluator evaluator(rule);

    QVERIFY(!evaluator.isPastCutoff(QDateTime(QDate(2024, 6, 30), QTime(23, 59))));
    QVERIFY(evaluator.isPastCutoff(QDateTime(QDate(2024, 7, 1), QTime(0, 0))));
}

void RuleEvaluatorTest::summaryText()
{
    const QString bullet = QStringLiteral(" %1 ").arg(QChar(0x2022));

    RecurrenceRule weekly;
    weekly.endNever = true;
    QCOMPARE(summary(weekly), QStringLiteral("Repeats weekly") + bullet + QStringLiteral("Forever"));

    RecurrenceRule everyOtherWeek;
    everyOtherWeek.interval = 2;
    everyOtherWeek.count = 4;
    QCOMPARE(summary(everyOtherWeek), QStringLiteral("Repeats every 2 weeks") + bullet + QStringLiteral("5 occurrences"));

    RecurrenceRule monthly;
    monthly.frequency = Monthly{};
    monthly.untilDate = QDate(2024, 12, 31);
    QCOMPARE(RuleEvaluator(monthly).summary(), QStringLiteral("Repeats monthly") + bullet + QStringLiteral("Until 2024-12-31"));
}

void RuleEvaluatorTest::anchorAtOrdinal()
{
    RecurrenceRule rule;
    rule.count = 3;
    const RuleEvaluator evaluator(rule);
    const QDateTime parentAnchor(QDate(2024, 1, 1), QTime(10, 0));

    QCOMPARE(evaluator.anchorAt(parentAnchor, 1), std::optional<QDateTime>(parentAnchor));
    QCOMPARE(evaluator.anchorAt(parentAnchor, 3), std::optional<QDateTime>(QDateTime(QDate(2024, 1, 15), QTime(10, 0))));
    QVERIFY(evaluator.anchorAt(parentAnchor, 4).has_value());
    QVERIFY(!evaluator.anchorAt(parentAnchor, 5).has_value());
    QVERIFY(!evaluator.anchorAt(parentAnchor, 0).has_value());

    const RuleEvaluator ended(RecurrenceRule{}, QDate(2024, 1, 10));
    QVERIFY(ended.anchorAt(parentAnchor, 2).has_value());
    QVERIFY(!ended.anchorAt(parentAnchor, 3).has_value());
}

void RuleEvaluatorTest::rejectsZeroInterval()
{
    RecurrenceRule rule;
    rule.interval = 0;
    const RuleEvaluator evaluator(rule);

    QVERIFY(!evaluator.isValid());
    QVERIFY(!evaluator.anchorAt(QDateTime(QDate(2024, 1, 1), QTime(10, 0)), 2).has_value());
}

QTEST_GUILESS_MAIN(RuleEvaluatorTest)
#include "RuleEvaluatorTest.moc"

#include "planner/recurrence/DateStepper.hpp"

namespace planner {
namespace recurrence {

namespace {
constexpr int kYearlyWeekFallbacks = 2;

QDateTime withDate(const QDateTime &anchor, const QDate &date)
{
    QDateTime result(anchor);
    result.setDate(date);
    return result;
}

struct StepVisitor
{
    const QDateTime &anchor;
    int interval;

    QDateTime operator()(const data::Daily &) const { return anchor.addDays(interval); }

    QDateTime operator()(const data::Weekly &) const { return anchor.addDays(7 * static_cast<qint64>(interval)); }

    QDateTime operator()(const data::Monthly &) const
    {
        const QDate date = anchor.date();
        const QDate targetMonth = QDate(date.year(), date.month(), 1).addMonths(interval);
        const auto target = nthWeekdayOfMonth(targetMonth.year(), targetMonth.month(), date.dayOfWeek(),
                                              weekdayOccurrenceInMonth(date));
        if (!target) {
            return anchor.addMonths(interval);
        }
        return withDate(anchor, *target);
    }

    QDateTime operator()(const data::Yearly &) const
    {
        const QDate date = anchor.date();
        int isoYear = 0;
        const int week = date.weekNumber(&isoYear);
        const int targetYear = isoYear + interval;
        for (int candidate = week; candidate >= week - kYearlyWeekFallbacks && candidate >= 1; --candidate) {
            if (const auto target = dateFromIsoWeek(targetYear, candidate, date.dayOfWeek())) {
                return withDate(anchor, *target);
            }
        }
        return anchor.addYears(interval);
    }
};
} // namespace

QDateTime nextAnchor(const QDateTime &anchor, const data::Frequency &frequency, int interval)
{
    return std::visit(StepVisitor{anchor, interval}, frequency);
}

int weekdayOccurrenceInMonth(const QDate &date)
{
    return (date.day() - 1) / 7 + 1;
}

std::optional<QDate> nthWeekdayOfMonth(int year, int month, int weekday, int occurrence)
{
    const QDate firstDay(year, month, 1);
    if (!firstDay.isValid() || weekday < 1 || weekday > 7 || occurrence < 1) {
        return std::nullopt;
    }
    const int daysUntilWeekday = (weekday - firstDay.dayOfWeek() + 7) % 7;
    QDate target = firstDay.addDays(daysUntilWeekday + 7 * (occurrence - 1));
    if (target.month() != month) {
        // No Nth weekday this month: use the last one.
        target = target.addDays(-7);
        if (target.month() != month || target.year() != year) {
            return std::nullopt;
        }
    }
    return target;
}

std::optional<QDate> dateFromIsoWeek(int isoYear, int week, int weekday)
{
    if (week < 1 || week > 53 || weekday < 1 || weekday > 7) {
        return std::nullopt;
    }
    // January 4th always lies in ISO week 1.
    const QDate january4(isoYear, 1, 4);
    if (!january4.isValid()) {
        return std::nullopt;
    }
    const QDate weekOneMonday = january4.addDays(1 - january4.dayOfWeek());
    const QDate target = weekOneMonday.addDays(7 * (week - 1) + (weekday - 1));
    int targetIsoYear = 0;
    if (target.weekNumber(&targetIsoYear) != week || targetIsoYear != isoYear) {
        return std::nullopt;
    }
    return target;
}

} // namespace recurrence
} // namespace planner

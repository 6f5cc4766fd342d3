#pragma once

#include <QDate>
#include <QDateTime>
#include <optional>

#include "planner/data/RecurrenceRule.hpp"

namespace planner {
namespace recurrence {

// Next anchor after `anchor` for the given frequency and interval. Works on the
// anchor's own local calendar date; time of day and time zone are preserved.
//  - monthly keeps the "Nth weekday of the month" (falls back to the month's
//    last such weekday, then to plain month arithmetic)
//  - yearly keeps the ISO week and weekday (retries week-1 and week-2, then
//    falls back to plain year arithmetic)
QDateTime nextAnchor(const QDateTime &anchor, const data::Frequency &frequency, int interval);

// 1-based occurrence of date's weekday within its month (the 15th is always the 3rd).
int weekdayOccurrenceInMonth(const QDate &date);

// weekday is 1 (Monday) to 7 (Sunday).
std::optional<QDate> nthWeekdayOfMonth(int year, int month, int weekday, int occurrence);

// Date for ISO year/week/weekday, or none when the week does not exist in that year.
std::optional<QDate> dateFromIsoWeek(int isoYear, int week, int weekday);

} // namespace recurrence
} // namespace planner

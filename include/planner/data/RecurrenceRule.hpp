#pragma once

#include <QDate>
#include <optional>
#include <variant>

namespace planner {
namespace data {

struct Daily
{
};

struct Weekly
{
};

struct Monthly
{
};

struct Yearly
{
};

using Frequency = std::variant<Daily, Weekly, Monthly, Yearly>;

// Owned by exactly one series parent. Termination is one of count, untilDate
// or forever (endNever, or neither count nor untilDate present).
struct RecurrenceRule
{
    Frequency frequency = Weekly{};
    int interval = 1;
    std::optional<int> count; // repeats after the parent
    std::optional<QDate> untilDate; // inclusive
    bool endNever = false;
};

inline bool operator==(const RecurrenceRule &lhs, const RecurrenceRule &rhs)
{
    return lhs.frequency.index() == rhs.frequency.index() && lhs.interval == rhs.interval
           && lhs.count == rhs.count && lhs.untilDate == rhs.untilDate && lhs.endNever == rhs.endNever;
}

inline bool operator!=(const RecurrenceRule &lhs, const RecurrenceRule &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace planner

#include "planner/recurrence/OccurrenceLocator.hpp"

#include "planner/recurrence/RuleEvaluator.hpp"

namespace planner {
namespace recurrence {

std::optional<int> OccurrenceLocator::ordinal(const data::Occurrence &parent, const QDateTime &instanceAnchor,
                                              int safetyCap)
{
    if (!parent.start.isValid() || !instanceAnchor.isValid()) {
        return std::nullopt;
    }
    const QDate target = instanceAnchor.date();
    if (target == parent.start.date()) {
        return 1;
    }
    if (!parent.rule) {
        return std::nullopt;
    }

    const RuleEvaluator evaluator(*parent.rule);
    if (!evaluator.isValid()) {
        return std::nullopt;
    }

    QDateTime anchor = parent.start;
    for (int step = 1; step <= safetyCap; ++step) {
        anchor = evaluator.next(anchor);
        if (!anchor.isValid() || anchor.date() > target) {
            return std::nullopt;
        }
        if (anchor.date() == target) {
            return step + 1;
        }
    }
    return std::nullopt;
}

} // namespace recurrence
} // namespace planner

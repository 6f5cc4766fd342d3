#include "planner/recurrence/WindowExpander.hpp"

#include "planner/core/Logging.hpp"
#include "planner/recurrence/RuleEvaluator.hpp"

#include <algorithm>

namespace planner {
namespace recurrence {

namespace {
VirtualOccurrence makeVirtual(const data::Occurrence &parent, const QDateTime &anchor, int ordinal)
{
    VirtualOccurrence occurrence;
    occurrence.parentId = parent.id;
    occurrence.originalAnchor = anchor;
    occurrence.start = anchor;
    occurrence.end = anchor.addSecs(parent.durationSecs());
    occurrence.ordinal = ordinal;
    occurrence.isParent = ordinal == 0;
    return occurrence;
}
} // namespace

std::vector<VirtualOccurrence> WindowExpander::expand(const data::Occurrence &parent,
                                                      const data::RecurrenceRule &rule, const QDate &windowStart,
                                                      const QDate &windowEnd, int safetyCap)
{
    std::vector<VirtualOccurrence> occurrences;
    if (!parent.start.isValid() || !windowStart.isValid() || !windowEnd.isValid() || safetyCap <= 0) {
        return occurrences;
    }

    const RuleEvaluator evaluator(rule, parent.seriesEndOverride);
    if (!evaluator.isValid()) {
        qCWarning(lcPlannerRecurrence) << "Invalid recurrence interval" << rule.interval << "for" << parent.id;
        return occurrences;
    }

    QDate lastDate = windowEnd;
    if (const auto cutoff = evaluator.cutoff()) {
        if (*cutoff < windowStart) {
            return occurrences;
        }
        lastDate = std::min(lastDate, *cutoff);
    }
    if (lastDate < windowStart) {
        return occurrences;
    }

    const QDate parentDate = parent.start.date();
    if (parentDate >= windowStart && parentDate <= lastDate) {
        occurrences.push_back(makeVirtual(parent, parent.start, 0));
    }

    const std::optional<int> maxSteps = evaluator.isForever() ? std::nullopt : rule.count;
    QDateTime anchor = parent.start;
    for (int step = 1; static_cast<int>(occurrences.size()) < safetyCap; ++step) {
        if (maxSteps && step > *maxSteps) {
            break;
        }
        anchor = evaluator.next(anchor);
        if (!anchor.isValid() || anchor.date() > lastDate) {
            break;
        }
        if (anchor.date() >= windowStart) {
            occurrences.push_back(makeVirtual(parent, anchor, step));
        }
    }
    return occurrences;
}

} // namespace recurrence
} // namespace planner

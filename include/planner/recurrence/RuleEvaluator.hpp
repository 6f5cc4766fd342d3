#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "planner/data/RecurrenceRule.hpp"

namespace planner {
namespace recurrence {

bool isForever(const data::RecurrenceRule &rule);
std::optional<QDate> effectiveCutoff(const data::RecurrenceRule &rule, const std::optional<QDate> &seriesEndOverride);
QString summary(const data::RecurrenceRule &rule);

// A rule paired with the series end override it is evaluated against. Holds
// its own copy so one evaluation never mixes two versions of a rule.
class RuleEvaluator
{
public:
    explicit RuleEvaluator(data::RecurrenceRule rule, std::optional<QDate> seriesEndOverride = std::nullopt);

    const data::RecurrenceRule &rule() const;
    bool isValid() const;
    bool isForever() const;
    std::optional<QDate> cutoff() const;
    bool isPastCutoff(const QDateTime &anchor) const;
    QString summary() const;

    QDateTime next(const QDateTime &anchor) const;
    // Anchor of occurrence `ordinal` (1 is the parent itself); none when it
    // falls after the cutoff or beyond the rule's count.
    std::optional<QDateTime> anchorAt(const QDateTime &parentAnchor, int ordinal) const;

private:
    data::RecurrenceRule m_rule;
    std::optional<QDate> m_cutoff;
};

} // namespace recurrence
} // namespace planner

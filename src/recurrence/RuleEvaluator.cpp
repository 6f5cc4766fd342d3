#include "planner/recurrence/RuleEvaluator.hpp"

#include "planner/recurrence/DateStepper.hpp"

#include <QStringList>
#include <algorithm>

namespace planner {
namespace recurrence {

namespace {
struct UnitVisitor
{
    QString operator()(const data::Daily &) const { return QStringLiteral("day"); }
    QString operator()(const data::Weekly &) const { return QStringLiteral("week"); }
    QString operator()(const data::Monthly &) const { return QStringLiteral("month"); }
    QString operator()(const data::Yearly &) const { return QStringLiteral("year"); }
};

struct AdverbVisitor
{
    QString operator()(const data::Daily &) const { return QStringLiteral("daily"); }
    QString operator()(const data::Weekly &) const { return QStringLiteral("weekly"); }
    QString operator()(const data::Monthly &) const { return QStringLiteral("monthly"); }
    QString operator()(const data::Yearly &) const { return QStringLiteral("yearly"); }
};
} // namespace

bool isForever(const data::RecurrenceRule &rule)
{
    return rule.endNever || (!rule.count && !rule.untilDate);
}

std::optional<QDate> effectiveCutoff(const data::RecurrenceRule &rule, const std::optional<QDate> &seriesEndOverride)
{
    if (rule.untilDate && seriesEndOverride) {
        return std::min(*rule.untilDate, *seriesEndOverride);
    }
    if (rule.untilDate) {
        return rule.untilDate;
    }
    return seriesEndOverride;
}

QString summary(const data::RecurrenceRule &rule)
{
    QStringList parts;
    if (rule.interval == 1) {
        parts << QStringLiteral("Repeats %1").arg(std::visit(AdverbVisitor{}, rule.frequency));
    } else {
        parts << QStringLiteral("Repeats every %1 %2s").arg(rule.interval).arg(std::visit(UnitVisitor{}, rule.frequency));
    }

    if (isForever(rule)) {
        parts << QStringLiteral("Forever");
    } else {
        if (rule.count) {
            // The stored count excludes the parent.
            parts << QStringLiteral("%1 occurrences").arg(*rule.count + 1);
        }
        if (rule.untilDate) {
            parts << QStringLiteral("Until %1").arg(rule.untilDate->toString(Qt::ISODate));
        }
    }
    return parts.join(QStringLiteral(" %1 ").arg(QChar(0x2022)));
}

RuleEvaluator::RuleEvaluator(data::RecurrenceRule rule, std::optional<QDate> seriesEndOverride)
    : m_rule(std::move(rule))
    , m_cutoff(effectiveCutoff(m_rule, seriesEndOverride))
{
}

const data::RecurrenceRule &RuleEvaluator::rule() const
{
    return m_rule;
}

bool RuleEvaluator::isValid() const
{
    return m_rule.interval >= 1;
}

bool RuleEvaluator::isForever() const
{
    return recurrence::isForever(m_rule);
}

std::optional<QDate> RuleEvaluator::cutoff() const
{
    return m_cutoff;
}

bool RuleEvaluator::isPastCutoff(const QDateTime &anchor) const
{
    return m_cutoff && anchor.date() > *m_cutoff;
}

QString RuleEvaluator::summary() const
{
    return recurrence::summary(m_rule);
}

QDateTime RuleEvaluator::next(const QDateTime &anchor) const
{
    return nextAnchor(anchor, m_rule.frequency, m_rule.interval);
}

std::optional<QDateTime> RuleEvaluator::anchorAt(const QDateTime &parentAnchor, int ordinal) const
{
    if (ordinal < 1 || !isValid() || !parentAnchor.isValid()) {
        return std::nullopt;
    }
    if (!isForever() && m_rule.count && ordinal > *m_rule.count + 1) {
        return std::nullopt;
    }
    QDateTime anchor = parentAnchor;
    for (int i = 1; i < ordinal; ++i) {
        anchor = next(anchor);
    }
    if (isPastCutoff(anchor)) {
        return std::nullopt;
    }
    return anchor;
}

} // namespace recurrence
} // namespace planner

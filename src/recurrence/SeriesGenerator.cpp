#include "planner/recurrence/SeriesGenerator.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/InstanceCreatedHook.hpp"
#include "planner/data/OccurrenceRepository.hpp"
#include "planner/data/Transaction.hpp"
#include "planner/recurrence/InstanceFactory.hpp"
#include "planner/recurrence/RuleEvaluator.hpp"

namespace planner {
namespace recurrence {

SeriesGenerator::SeriesGenerator(data::OccurrenceRepository &repository, data::InstanceCreatedHook *hook,
                                 int defaultCount)
    : m_repository(repository)
    , m_hook(hook)
    , m_defaultCount(defaultCount > 0 ? defaultCount : kDefaultCount)
{
}

std::vector<data::Occurrence> SeriesGenerator::generate(const data::Occurrence &parent,
                                                        const data::RecurrenceRule &rule, int maxCount,
                                                        const std::optional<QDate> &untilDate)
{
    std::vector<data::Occurrence> instances;
    if (!parent.start.isValid() || maxCount <= 0) {
        return instances;
    }

    const RuleEvaluator evaluator(rule, parent.seriesEndOverride);
    if (!evaluator.isValid()) {
        qCWarning(lcPlannerRecurrence) << "Invalid recurrence interval" << rule.interval << "for" << parent.id;
        return instances;
    }

    std::optional<QDate> cutoff = evaluator.cutoff();
    if (untilDate && (!cutoff || *untilDate < *cutoff)) {
        cutoff = untilDate;
    }

    instances.reserve(static_cast<size_t>(maxCount));
    QDateTime anchor = parent.start;
    while (static_cast<int>(instances.size()) < maxCount) {
        anchor = evaluator.next(anchor);
        if (!anchor.isValid() || (cutoff && anchor.date() > *cutoff)) {
            break;
        }
        instances.push_back(makeInstance(parent, anchor));
    }
    return instances;
}

std::optional<std::vector<data::Occurrence>> SeriesGenerator::createInstances(const data::Occurrence &parent,
                                                                              std::optional<int> maxCount,
                                                                              std::optional<QDate> untilDate)
{
    if (!parent.isSeriesParent()) {
        qCWarning(lcPlannerRecurrence) << "Occurrence" << parent.id << "is not a series parent";
        return std::vector<data::Occurrence>{};
    }

    const data::RecurrenceRule rule = *parent.rule;
    const int count = maxCount.value_or(rule.count.value_or(m_defaultCount));
    std::vector<data::Occurrence> generated = generate(parent, rule, count, untilDate);
    if (generated.empty()) {
        return generated;
    }

    std::optional<data::Transaction> transaction;
    if (!m_repository.inTransaction()) {
        transaction.emplace(m_repository);
        if (!transaction->isActive()) {
            qCWarning(lcPlannerRecurrence) << "Cannot open a transaction for series" << parent.id;
            return std::nullopt;
        }
    }

    std::vector<data::Occurrence> created;
    created.reserve(generated.size());
    for (auto &instance : generated) {
        const data::StoreStatus status = m_repository.insert(instance);
        if (status == data::StoreStatus::DuplicateAnchor) {
            qCDebug(lcPlannerRecurrence) << "Slot" << instance.originalAnchor << "of" << parent.id
                                         << "is already held, skipping";
            continue;
        }
        if (status != data::StoreStatus::Ok) {
            qCWarning(lcPlannerRecurrence) << "Storing instance of" << parent.id << "failed:" << data::toString(status);
            return std::nullopt;
        }
        if (m_hook && !m_hook->onInstanceCreated(instance, m_repository)) {
            qCWarning(lcPlannerRecurrence) << "Instance hook rejected" << instance.id << "of series" << parent.id;
            return std::nullopt;
        }
        created.push_back(instance);
    }

    if (transaction && !transaction->commit()) {
        qCWarning(lcPlannerRecurrence) << "Committing instances of" << parent.id << "failed";
        return std::nullopt;
    }

    qCInfo(lcPlannerRecurrence) << "Created" << created.size() << "recurring instances for job" << parent.id;
    return created;
}

} // namespace recurrence
} // namespace planner

#include "planner/recurrence/SeriesLifecycle.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/OccurrenceRepository.hpp"
#include "planner/data/Transaction.hpp"
#include "planner/recurrence/RuleEvaluator.hpp"
#include "planner/recurrence/SeriesGenerator.hpp"

namespace planner {
namespace recurrence {

namespace {
QDateTime anchorOf(const data::Occurrence &occurrence)
{
    return occurrence.originalAnchor.isValid() ? occurrence.originalAnchor : occurrence.start;
}

LifecycleResult rejected(const QString &reason)
{
    qCWarning(lcPlannerRecurrence).noquote() << reason;
    LifecycleResult result;
    result.error = reason;
    return result;
}

LifecycleResult succeeded(int affected)
{
    LifecycleResult result;
    result.ok = true;
    result.affected = affected;
    return result;
}

QString shortId(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}
} // namespace

DeleteScope deleteScopeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("all")) {
        return DeleteScope::All;
    }
    if (normalized == QLatin1String("this_and_future") || normalized == QLatin1String("future")) {
        return DeleteScope::ThisAndFuture;
    }
    return DeleteScope::ThisOnly;
}

QString toString(DeleteScope scope)
{
    switch (scope) {
    case DeleteScope::All:
        return QStringLiteral("all");
    case DeleteScope::ThisAndFuture:
        return QStringLiteral("this_and_future");
    case DeleteScope::ThisOnly:
    default:
        return QStringLiteral("this_only");
    }
}

SeriesLifecycle::SeriesLifecycle(data::OccurrenceRepository &repository, SeriesGenerator &generator)
    : m_repository(repository)
    , m_generator(generator)
{
}

LifecycleResult SeriesLifecycle::deleteOccurrence(const QUuid &targetId, DeleteScope scope)
{
    data::Transaction transaction(m_repository);
    if (!transaction.isActive()) {
        return rejected(QStringLiteral("Cannot open a transaction"));
    }

    const auto target = m_repository.findById(targetId);
    if (!target) {
        return rejected(QStringLiteral("Occurrence %1 not found").arg(shortId(targetId)));
    }

    std::optional<data::Occurrence> parent;
    if (target->isInstance()) {
        parent = m_repository.findById(target->parentId);
    } else if (target->isSeriesParent()) {
        parent = target;
    }

    int affected = 0;
    if (!parent) {
        // Not part of a series: every scope removes just this occurrence.
        if (!softDelete(*target, affected)) {
            return rejected(QStringLiteral("Deleting occurrence %1 failed").arg(shortId(targetId)));
        }
    } else if (scope == DeleteScope::ThisOnly) {
        if (!target->isInstance() && !m_repository.instancesOf(parent->id).empty()) {
            return rejected(QStringLiteral("Cannot delete only the series template while the series still has "
                                           "occurrences; delete this and future occurrences or the whole series"));
        }
        if (!softDelete(*target, affected)) {
            return rejected(QStringLiteral("Deleting occurrence %1 failed").arg(shortId(targetId)));
        }
    } else if (scope == DeleteScope::ThisAndFuture) {
        const LifecycleResult result = deleteThisAndFuture(*target, *parent);
        if (!result.ok) {
            return result;
        }
        affected = result.affected;
    } else {
        for (const auto &instance : m_repository.instancesOf(parent->id)) {
            if (!softDelete(instance, affected)) {
                return rejected(QStringLiteral("Deleting series %1 failed").arg(shortId(parent->id)));
            }
        }
        if (!softDelete(*parent, affected)) {
            return rejected(QStringLiteral("Deleting series %1 failed").arg(shortId(parent->id)));
        }
    }

    if (!transaction.commit()) {
        return rejected(QStringLiteral("Committing the deletion failed"));
    }
    qCInfo(lcPlannerRecurrence) << "Deleted" << affected << "occurrences for" << targetId << "with scope"
                                << toString(scope);
    return succeeded(affected);
}

LifecycleResult SeriesLifecycle::deleteThisAndFuture(const data::Occurrence &target, data::Occurrence parent)
{
    int affected = 0;
    data::InstanceFilter filter;
    filter.excludeCompleted = true;

    QDate newSeriesEnd;
    if (target.isInstance()) {
        const QDate fromDate = anchorOf(target).date();
        if (target.status != data::OccurrenceStatus::Completed && !softDelete(target, affected)) {
            return rejected(QStringLiteral("Deleting occurrence %1 failed").arg(shortId(target.id)));
        }
        filter.anchorFrom = fromDate;
        newSeriesEnd = fromDate.addDays(-1);
    } else {
        newSeriesEnd = parent.start.date();
    }

    for (const auto &instance : m_repository.instancesOf(parent.id, filter)) {
        if (instance.id == target.id) {
            continue;
        }
        if (!softDelete(instance, affected)) {
            return rejected(QStringLiteral("Deleting occurrence %1 failed").arg(shortId(instance.id)));
        }
    }

    if (!parent.seriesEndOverride || newSeriesEnd < *parent.seriesEndOverride) {
        parent.seriesEndOverride = newSeriesEnd;
    }
    if (m_repository.update(parent) != data::StoreStatus::Ok) {
        return rejected(QStringLiteral("Updating series %1 failed").arg(shortId(parent.id)));
    }
    return succeeded(affected);
}

LifecycleResult SeriesLifecycle::cancelFutureRecurrences(const QUuid &parentId, const QDate &fromDate)
{
    if (!fromDate.isValid()) {
        return rejected(QStringLiteral("Invalid date to cancel from"));
    }

    data::Transaction transaction(m_repository);
    if (!transaction.isActive()) {
        return rejected(QStringLiteral("Cannot open a transaction"));
    }

    auto parent = m_repository.findById(parentId);
    if (!parent || !parent->isSeriesParent()) {
        return rejected(QStringLiteral("Occurrence %1 is not a recurring series").arg(shortId(parentId)));
    }

    parent->seriesEndOverride = fromDate;
    if (m_repository.update(*parent) != data::StoreStatus::Ok) {
        return rejected(QStringLiteral("Updating series %1 failed").arg(shortId(parentId)));
    }

    data::InstanceFilter filter;
    filter.anchorFrom = fromDate;
    filter.excludeCompleted = true;
    int canceled = 0;
    for (auto instance : m_repository.instancesOf(parentId, filter)) {
        if (instance.status == data::OccurrenceStatus::Canceled) {
            continue;
        }
        instance.status = data::OccurrenceStatus::Canceled;
        if (m_repository.update(instance) != data::StoreStatus::Ok) {
            return rejected(QStringLiteral("Canceling occurrence %1 failed").arg(shortId(instance.id)));
        }
        ++canceled;
    }

    if (!transaction.commit()) {
        return rejected(QStringLiteral("Committing the cancellation failed"));
    }
    qCInfo(lcPlannerRecurrence) << "Canceled" << canceled << "future instances for job" << parentId << "from"
                                << fromDate;
    return succeeded(canceled);
}

LifecycleResult SeriesLifecycle::changeRule(const QUuid &parentId, const std::optional<data::RecurrenceRule> &rule)
{
    data::Transaction transaction(m_repository);
    if (!transaction.isActive()) {
        return rejected(QStringLiteral("Cannot open a transaction"));
    }

    auto parent = m_repository.findById(parentId);
    if (!parent || parent->deleted) {
        return rejected(QStringLiteral("Occurrence %1 not found").arg(shortId(parentId)));
    }
    if (parent->isInstance()) {
        return rejected(QStringLiteral("Cannot change the recurrence of a single occurrence; edit the series instead"));
    }

    parent->rule = rule;
    if (m_repository.update(*parent) != data::StoreStatus::Ok) {
        return rejected(QStringLiteral("Updating series %1 failed").arg(shortId(parentId)));
    }

    if (parent->isSeriesParent() && isForever(*parent->rule)) {
        // Stored instances stay; further slots are materialized on demand.
        if (!transaction.commit()) {
            return rejected(QStringLiteral("Committing the new recurrence failed"));
        }
        qCInfo(lcPlannerRecurrence) << "Job" << parentId << "now repeats forever, kept its stored instances";
        return succeeded(0);
    }

    const auto created = regenerateInTransaction(*parent);
    if (!created) {
        return rejected(QStringLiteral("Regenerating series %1 failed").arg(shortId(parentId)));
    }
    if (!transaction.commit()) {
        return rejected(QStringLiteral("Committing the new recurrence failed"));
    }
    qCInfo(lcPlannerRecurrence) << "Changed recurrence of job" << parentId << "and created" << *created
                                << "instances";
    return succeeded(*created);
}

LifecycleResult SeriesLifecycle::updateInstances(const QUuid &parentId, const data::JobSnapshot &snapshot,
                                                 const std::optional<QDate> &fromDate)
{
    data::Transaction transaction(m_repository);
    if (!transaction.isActive()) {
        return rejected(QStringLiteral("Cannot open a transaction"));
    }

    data::InstanceFilter filter;
    filter.anchorFrom = fromDate;
    filter.excludeTerminal = true;
    int updated = 0;
    for (auto instance : m_repository.instancesOf(parentId, filter)) {
        if (instance.snapshot == snapshot) {
            continue;
        }
        instance.snapshot = snapshot;
        if (m_repository.update(instance) != data::StoreStatus::Ok) {
            return rejected(QStringLiteral("Updating occurrence %1 failed").arg(shortId(instance.id)));
        }
        ++updated;
    }

    if (!transaction.commit()) {
        return rejected(QStringLiteral("Committing the update failed"));
    }
    qCInfo(lcPlannerRecurrence) << "Updated" << updated << "recurring instances for job" << parentId;
    return succeeded(updated);
}

TrimReport SeriesLifecycle::trim(const TrimOptions &options, const QDate &today)
{
    TrimReport report;
    const QDate horizon = today.addDays(static_cast<qint64>(options.horizonYears) * 365);

    for (auto parent : m_repository.seriesParents()) {
        if (parent.status == data::OccurrenceStatus::Canceled) {
            continue;
        }
        const auto live = m_repository.instancesOf(parent.id);
        if (static_cast<int>(live.size()) < options.minInstances) {
            continue;
        }

        std::vector<data::Occurrence> beyondHorizon;
        for (const auto &instance : live) {
            if (anchorOf(instance).date() > horizon && instance.status == data::OccurrenceStatus::Uncompleted) {
                beyondHorizon.push_back(instance);
            }
        }
        if (beyondHorizon.empty()) {
            continue;
        }

        ++report.seriesAffected;
        qCInfo(lcPlannerRecurrence) << "Series" << parent.id << "has" << live.size() << "instances," << beyondHorizon.size()
                                    << "beyond" << horizon;
        if (options.dryRun) {
            report.instancesTrimmed += static_cast<int>(beyondHorizon.size());
            continue;
        }

        data::Transaction transaction(m_repository);
        if (!transaction.isActive()) {
            qCWarning(lcPlannerRecurrence) << "Cannot open a transaction to trim" << parent.id;
            continue;
        }
        bool failed = false;
        for (const auto &instance : beyondHorizon) {
            if (m_repository.remove(instance.id) != data::StoreStatus::Ok) {
                failed = true;
                break;
            }
        }
        bool converted = false;
        if (!failed && options.convertToForever && parent.rule && !parent.rule->endNever) {
            parent.rule->endNever = true;
            parent.rule->count.reset();
            parent.rule->untilDate.reset();
            parent.seriesEndOverride.reset();
            failed = m_repository.update(parent) != data::StoreStatus::Ok;
            converted = !failed;
        }
        if (failed || !transaction.commit()) {
            qCWarning(lcPlannerRecurrence) << "Trimming series" << parent.id << "failed";
            continue;
        }
        report.instancesTrimmed += static_cast<int>(beyondHorizon.size());
        if (converted) {
            ++report.seriesConverted;
        }
    }

    qCInfo(lcPlannerRecurrence) << "Trimmed" << report.instancesTrimmed << "instances in" << report.seriesAffected
                                << "series" << (options.dryRun ? "(dry run)" : "");
    return report;
}

bool SeriesLifecycle::softDelete(data::Occurrence occurrence, int &affected)
{
    if (occurrence.deleted) {
        return true;
    }
    occurrence.deleted = true;
    if (m_repository.update(occurrence) != data::StoreStatus::Ok) {
        return false;
    }
    ++affected;
    return true;
}

std::optional<int> SeriesLifecycle::regenerateInTransaction(const data::Occurrence &parent)
{
    data::InstanceFilter filter;
    filter.includeDeleted = true;
    filter.excludeTerminal = true;
    for (const auto &instance : m_repository.instancesOf(parent.id, filter)) {
        if (m_repository.remove(instance.id) != data::StoreStatus::Ok) {
            return std::nullopt;
        }
    }

    if (!parent.isSeriesParent()) {
        return 0;
    }
    const auto created = m_generator.createInstances(parent);
    if (!created) {
        return std::nullopt;
    }
    return static_cast<int>(created->size());
}

} // namespace recurrence
} // namespace planner

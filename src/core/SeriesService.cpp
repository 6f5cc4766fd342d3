#include "planner/core/SeriesService.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/OccurrenceRepository.hpp"
#include "planner/data/Transaction.hpp"
#include "planner/recurrence/InstanceFactory.hpp"
#include "planner/recurrence/OccurrenceLocator.hpp"
#include "planner/recurrence/RuleEvaluator.hpp"

#include <QHash>
#include <QSet>
#include <algorithm>

namespace planner {
namespace core {

namespace {
QSet<qint64> materializedAnchors(const data::OccurrenceRepository &repository, const QUuid &parentId)
{
    data::InstanceFilter filter;
    filter.includeDeleted = true;
    QSet<qint64> anchors;
    for (const auto &instance : repository.instancesOf(parentId, filter)) {
        anchors.insert(instance.originalAnchor.toMSecsSinceEpoch());
    }
    return anchors;
}

SeriesResult seriesFailure(const QString &message)
{
    qCWarning(lcPlannerCore).noquote() << message;
    SeriesResult result;
    result.error = message;
    return result;
}
} // namespace

SeriesService::SeriesService(data::OccurrenceRepository &repository, RecurrenceSettings settings,
                             data::InstanceCreatedHook *hook)
    : m_repository(repository)
    , m_settings(std::move(settings))
    , m_generator(repository, hook, m_settings.defaultGenerationCount)
    , m_materializer(repository, hook)
    , m_lifecycle(repository, m_generator)
{
}

const RecurrenceSettings &SeriesService::settings() const
{
    return m_settings;
}

SeriesResult SeriesService::createSeries(data::Occurrence parent)
{
    if (parent.isInstance()) {
        return seriesFailure(QStringLiteral("Cannot make a recurring instance into a new recurring series"));
    }
    if (!parent.start.isValid()) {
        return seriesFailure(QStringLiteral("An occurrence needs a valid start"));
    }
    if (parent.rule && parent.rule->interval < 1) {
        return seriesFailure(QStringLiteral("Recurrence interval must be at least 1"));
    }

    data::Transaction transaction(m_repository);
    if (!transaction.isActive()) {
        return seriesFailure(QStringLiteral("Cannot open a transaction"));
    }
    const data::StoreStatus status = m_repository.insert(parent);
    if (status != data::StoreStatus::Ok) {
        return seriesFailure(QStringLiteral("Storing the occurrence failed: %1").arg(QLatin1String(data::toString(status))));
    }

    SeriesResult result;
    if (parent.isSeriesParent() && !recurrence::isForever(*parent.rule)) {
        auto created = m_generator.createInstances(parent);
        if (!created) {
            return seriesFailure(QStringLiteral("Generating the series failed"));
        }
        result.instances = std::move(*created);
    }
    if (!transaction.commit()) {
        return seriesFailure(QStringLiteral("Committing the series failed"));
    }
    result.parent = parent;
    return result;
}

std::vector<CalendarEntry> SeriesService::occurrencesInWindow(const QDate &from, const QDate &to) const
{
    std::vector<CalendarEntry> entries;
    if (!from.isValid() || !to.isValid() || to < from) {
        return entries;
    }

    QHash<QUuid, data::Occurrence> parents;
    for (auto &parent : m_repository.seriesParents()) {
        parents.insert(parent.id, parent);
    }

    for (auto &occurrence : m_repository.fetchOccurrences(from, to)) {
        CalendarEntry entry;
        const auto parentIt = occurrence.isInstance() ? parents.constFind(occurrence.parentId) : parents.constEnd();
        entry.ordinal = ordinalOf(occurrence, parentIt != parents.constEnd() ? &parentIt.value() : nullptr);
        entry.occurrence = std::move(occurrence);
        entries.push_back(std::move(entry));
    }

    for (const auto &parent : parents) {
        if (!recurrence::isForever(*parent.rule)) {
            continue;
        }
        const QSet<qint64> materialized = materializedAnchors(m_repository, parent.id);
        const auto expanded =
            recurrence::WindowExpander::expand(parent, *parent.rule, from, to, m_settings.windowSafetyCap);
        for (const auto &occurrence : expanded) {
            if (occurrence.isParent || materialized.contains(occurrence.originalAnchor.toMSecsSinceEpoch())) {
                continue;
            }
            CalendarEntry entry;
            entry.occurrence = recurrence::makeInstance(parent, occurrence.originalAnchor);
            entry.occurrence.id = QUuid();
            entry.isVirtual = true;
            entry.ordinal = occurrence.ordinal + 1;
            entries.push_back(std::move(entry));
        }
    }

    std::stable_sort(entries.begin(), entries.end(), [](const CalendarEntry &lhs, const CalendarEntry &rhs) {
        return lhs.occurrence.start < rhs.occurrence.start;
    });
    return entries;
}

PreviewResult SeriesService::preview(const QUuid &parentId, const QDate &after, int count) const
{
    PreviewResult result;
    const auto parent = m_repository.findById(parentId);
    if (!parent || parent->deleted) {
        result.error = QStringLiteral("Job not found");
        return result;
    }
    if (!parent->isSeriesParent()) {
        result.error = QStringLiteral("Job is not a recurring series parent");
        return result;
    }
    const recurrence::RuleEvaluator evaluator(*parent->rule, parent->seriesEndOverride);
    if (!evaluator.isForever()) {
        result.error = QStringLiteral("Preview is only available for series that repeat forever");
        return result;
    }
    if (!evaluator.isValid()) {
        result.error = QStringLiteral("Invalid recurrence interval");
        return result;
    }

    const int limit = count <= 0 ? m_settings.previewDefaultCount : std::min(count, m_settings.previewMaxCount);
    const QSet<qint64> materialized = materializedAnchors(m_repository, parent->id);
    const qint64 duration = parent->durationSecs();

    QDateTime anchor = parent->start;
    for (int step = 1;; ++step) {
        if (step > m_settings.previewStepCap) {
            qCWarning(lcPlannerCore) << "Preview of" << parent->id << "stopped after" << m_settings.previewStepCap
                                     << "steps";
            result.hasMore = true;
            break;
        }
        anchor = evaluator.next(anchor);
        if (!anchor.isValid() || evaluator.isPastCutoff(anchor)) {
            break;
        }
        if (anchor.date() <= after || materialized.contains(anchor.toMSecsSinceEpoch())) {
            continue;
        }
        if (static_cast<int>(result.occurrences.size()) == limit) {
            result.hasMore = true;
            break;
        }
        recurrence::VirtualOccurrence occurrence;
        occurrence.parentId = parent->id;
        occurrence.originalAnchor = anchor;
        occurrence.start = anchor;
        occurrence.end = anchor.addSecs(duration);
        occurrence.ordinal = step;
        result.occurrences.push_back(occurrence);
    }
    return result;
}

std::optional<int> SeriesService::ordinal(const QUuid &occurrenceId) const
{
    const auto occurrence = m_repository.findById(occurrenceId);
    if (!occurrence) {
        return std::nullopt;
    }
    if (!occurrence->isInstance()) {
        return ordinalOf(*occurrence, nullptr);
    }
    const auto parent = m_repository.findById(occurrence->parentId);
    return ordinalOf(*occurrence, parent ? &*parent : nullptr);
}

std::optional<QString> SeriesService::summary(const QUuid &parentId) const
{
    const auto parent = m_repository.findById(parentId);
    if (!parent || !parent->isSeriesParent()) {
        return std::nullopt;
    }
    return recurrence::summary(*parent->rule);
}

recurrence::MaterializeResult SeriesService::materialize(const QUuid &parentId, const QDateTime &originalAnchor)
{
    const auto parent = m_repository.findById(parentId);
    if (!parent || parent->deleted) {
        recurrence::MaterializeResult result;
        result.error = QStringLiteral("Series %1 not found").arg(parentId.toString(QUuid::WithoutBraces));
        return result;
    }
    return m_materializer.materialize(*parent, originalAnchor);
}

recurrence::LifecycleResult SeriesService::deleteOccurrence(const QUuid &occurrenceId, recurrence::DeleteScope scope)
{
    return m_lifecycle.deleteOccurrence(occurrenceId, scope);
}

recurrence::LifecycleResult SeriesService::cancelFuture(const QUuid &occurrenceId, const QDate &fromDate)
{
    const auto occurrence = m_repository.findById(occurrenceId);
    if (!occurrence) {
        recurrence::LifecycleResult result;
        result.error = QStringLiteral("Occurrence %1 not found").arg(occurrenceId.toString(QUuid::WithoutBraces));
        return result;
    }
    const QUuid parentId = occurrence->isInstance() ? occurrence->parentId : occurrence->id;
    return m_lifecycle.cancelFutureRecurrences(parentId, fromDate);
}

recurrence::LifecycleResult SeriesService::changeRule(const QUuid &parentId,
                                                      const std::optional<data::RecurrenceRule> &rule)
{
    return m_lifecycle.changeRule(parentId, rule);
}

recurrence::LifecycleResult SeriesService::updateInstances(const QUuid &parentId, const data::JobSnapshot &snapshot,
                                                           const std::optional<QDate> &fromDate)
{
    return m_lifecycle.updateInstances(parentId, snapshot, fromDate);
}

recurrence::TrimReport SeriesService::trim(const recurrence::TrimOptions &options, const QDate &today)
{
    return m_lifecycle.trim(options, today);
}

std::optional<int> SeriesService::ordinalOf(const data::Occurrence &occurrence, const data::Occurrence *parent) const
{
    if (occurrence.isSeriesParent()) {
        return 1;
    }
    if (!occurrence.isInstance() || !parent) {
        return std::nullopt;
    }
    return recurrence::OccurrenceLocator::ordinal(*parent, occurrence.originalAnchor, m_settings.ordinalSafetyCap);
}

} // namespace core
} // namespace planner

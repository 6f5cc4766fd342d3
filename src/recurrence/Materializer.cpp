#include "planner/recurrence/Materializer.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/InstanceCreatedHook.hpp"
#include "planner/data/OccurrenceRepository.hpp"
#include "planner/data/Transaction.hpp"
#include "planner/recurrence/InstanceFactory.hpp"
#include "planner/recurrence/RuleEvaluator.hpp"

#include <QTimeZone>

namespace planner {
namespace recurrence {

Materializer::Materializer(data::OccurrenceRepository &repository, data::InstanceCreatedHook *hook)
    : m_repository(repository)
    , m_hook(hook)
{
}

MaterializeResult Materializer::materialize(const data::Occurrence &parent, const QDateTime &originalAnchor)
{
    MaterializeResult result;
    if (!parent.isSeriesParent()) {
        result.error = QStringLiteral("Occurrence %1 is not a recurring series parent")
                           .arg(parent.id.toString(QUuid::WithoutBraces));
        return result;
    }
    if (!originalAnchor.isValid()) {
        result.error = QStringLiteral("Invalid original start");
        return result;
    }

    const QDateTime anchor = normalizeAnchor(parent, originalAnchor);
    if (anchor == parent.start) {
        result.occurrence = parent;
        return result;
    }

    const RuleEvaluator evaluator(*parent.rule, parent.seriesEndOverride);
    if (evaluator.isPastCutoff(anchor) || anchor < parent.start) {
        result.error = QStringLiteral("%1 is outside of the series").arg(anchor.toString(Qt::ISODate));
        return result;
    }

    switch (findOrCreate(parent, anchor, result)) {
    case Attempt::Created:
        qCDebug(lcPlannerRecurrence) << "Materialized" << anchor << "of series" << parent.id << "as"
                                     << result.occurrence->id;
        return result;
    case Attempt::Found:
        return result;
    case Attempt::Conflict:
        break;
    case Attempt::Failed:
    default:
        if (result.error.isEmpty()) {
            result.error = QStringLiteral("Could not store the occurrence");
        }
        return result;
    }

    // Lost the race for this slot: the winner's row must be there now.
    qCDebug(lcPlannerRecurrence) << "Concurrent materialization of" << anchor << "for" << parent.id << ", retrying lookup";
    if (auto winner = m_repository.findInstance(parent.id, anchor)) {
        result.occurrence = std::move(winner);
        result.wasCreated = false;
        return result;
    }
    result.error = QStringLiteral("Internal error: conflicting occurrence for %1 not found")
                       .arg(anchor.toString(Qt::ISODate));
    qCCritical(lcPlannerRecurrence).noquote() << result.error;
    return result;
}

QDateTime Materializer::normalizeAnchor(const data::Occurrence &parent, const QDateTime &originalAnchor)
{
    switch (parent.start.timeSpec()) {
    case Qt::UTC:
        return originalAnchor.toUTC();
    case Qt::OffsetFromUTC:
        return originalAnchor.toOffsetFromUtc(parent.start.offsetFromUtc());
    case Qt::TimeZone:
        return originalAnchor.toTimeZone(parent.start.timeZone());
    case Qt::LocalTime:
    default:
        return originalAnchor.toLocalTime();
    }
}

Materializer::Attempt Materializer::findOrCreate(const data::Occurrence &parent, const QDateTime &anchor,
                                                 MaterializeResult &result)
{
    std::optional<data::Transaction> transaction;
    if (!m_repository.inTransaction()) {
        transaction.emplace(m_repository);
        if (!transaction->isActive()) {
            result.error = QStringLiteral("Cannot open a transaction");
            return Attempt::Failed;
        }
    }

    if (auto existing = m_repository.findInstance(parent.id, anchor)) {
        result.occurrence = std::move(existing);
        result.wasCreated = false;
        return Attempt::Found;
    }

    data::Occurrence instance = makeInstance(parent, anchor);
    const data::StoreStatus status = m_repository.insert(instance);
    if (status == data::StoreStatus::DuplicateAnchor) {
        return Attempt::Conflict;
    }
    if (status != data::StoreStatus::Ok) {
        result.error = QStringLiteral("Storing the occurrence failed: %1").arg(QLatin1String(data::toString(status)));
        return Attempt::Failed;
    }
    if (m_hook && !m_hook->onInstanceCreated(instance, m_repository)) {
        result.error = QStringLiteral("Creating the call reminder failed");
        return Attempt::Failed;
    }
    if (transaction && !transaction->commit()) {
        result.error = QStringLiteral("Committing the occurrence failed");
        return Attempt::Failed;
    }

    result.occurrence = instance;
    result.wasCreated = true;
    return Attempt::Created;
}

} // namespace recurrence
} // namespace planner

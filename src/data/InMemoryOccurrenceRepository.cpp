#include "planner/data/InMemoryOccurrenceRepository.hpp"

#include "planner/core/Logging.hpp"

#include <QMutexLocker>
#include <QThread>
#include <algorithm>

namespace planner {
namespace data {

const char *toString(StoreStatus status)
{
    switch (status) {
    case StoreStatus::Ok:
        return "ok";
    case StoreStatus::NotFound:
        return "not found";
    case StoreStatus::DuplicateAnchor:
        return "duplicate original anchor";
    case StoreStatus::Failed:
    default:
        return "failed";
    }
}

InMemoryOccurrenceRepository::InMemoryOccurrenceRepository() = default;
InMemoryOccurrenceRepository::~InMemoryOccurrenceRepository() = default;

template<typename Write>
StoreStatus InMemoryOccurrenceRepository::write(Write &&apply)
{
    if (ownsTransaction()) {
        QMutexLocker locker(&m_mutex);
        return apply();
    }

    QMutexLocker writer(&m_writerLock);
    QMutexLocker locker(&m_mutex);
    const auto occurrencesBefore = m_occurrences;
    const auto remindersBefore = m_reminders;
    const StoreStatus status = apply();
    if (status != StoreStatus::Ok) {
        return status;
    }
    if (!persist()) {
        m_occurrences = occurrencesBefore;
        m_reminders = remindersBefore;
        return StoreStatus::Failed;
    }
    return StoreStatus::Ok;
}

bool InMemoryOccurrenceRepository::beginTransaction()
{
    if (ownsTransaction()) {
        qCWarning(lcPlannerData) << "Nested transactions are not supported";
        return false;
    }
    m_writerLock.lock();
    QMutexLocker locker(&m_mutex);
    m_occurrencesBackup = m_occurrences;
    m_remindersBackup = m_reminders;
    m_inTransaction = true;
    m_transactionOwner = QThread::currentThread();
    return true;
}

bool InMemoryOccurrenceRepository::commit()
{
    if (!ownsTransaction()) {
        return false;
    }
    bool persisted = false;
    {
        QMutexLocker locker(&m_mutex);
        persisted = persist();
        if (!persisted) {
            qCWarning(lcPlannerData) << "Commit failed to persist, rolling back";
            m_occurrences = m_occurrencesBackup;
            m_reminders = m_remindersBackup;
        }
        m_occurrencesBackup.clear();
        m_remindersBackup.clear();
        m_inTransaction = false;
        m_transactionOwner = nullptr;
    }
    m_writerLock.unlock();
    return persisted;
}

void InMemoryOccurrenceRepository::rollback()
{
    if (!ownsTransaction()) {
        return;
    }
    {
        QMutexLocker locker(&m_mutex);
        m_occurrences = m_occurrencesBackup;
        m_reminders = m_remindersBackup;
        m_occurrencesBackup.clear();
        m_remindersBackup.clear();
        m_inTransaction = false;
        m_transactionOwner = nullptr;
    }
    m_writerLock.unlock();
}

bool InMemoryOccurrenceRepository::inTransaction() const
{
    return ownsTransaction();
}

std::optional<Occurrence> InMemoryOccurrenceRepository::findById(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_occurrences.constFind(id);
    if (it == m_occurrences.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::optional<Occurrence> InMemoryOccurrenceRepository::findInstance(const QUuid &parentId,
                                                                     const QDateTime &originalAnchor) const
{
    QMutexLocker locker(&m_mutex);
    for (const auto &occurrence : m_occurrences) {
        if (occurrence.parentId == parentId && occurrence.originalAnchor == originalAnchor) {
            return occurrence;
        }
    }
    return std::nullopt;
}

std::vector<Occurrence> InMemoryOccurrenceRepository::instancesOf(const QUuid &parentId,
                                                                  const InstanceFilter &filter) const
{
    std::vector<Occurrence> instances;
    {
        QMutexLocker locker(&m_mutex);
        for (const auto &occurrence : m_occurrences) {
            if (parentId.isNull() || occurrence.parentId != parentId) {
                continue;
            }
            if (occurrence.deleted && !filter.includeDeleted) {
                continue;
            }
            if (filter.excludeTerminal && isTerminal(occurrence.status)) {
                continue;
            }
            if (filter.excludeCompleted && occurrence.status == OccurrenceStatus::Completed) {
                continue;
            }
            if (filter.anchorFrom && occurrence.originalAnchor.date() < *filter.anchorFrom) {
                continue;
            }
            instances.push_back(occurrence);
        }
    }
    std::sort(instances.begin(), instances.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        return lhs.originalAnchor < rhs.originalAnchor;
    });
    return instances;
}

std::vector<Occurrence> InMemoryOccurrenceRepository::fetchOccurrences(const QDate &from, const QDate &to) const
{
    std::vector<Occurrence> result;
    {
        QMutexLocker locker(&m_mutex);
        for (const auto &occurrence : m_occurrences) {
            if (occurrence.deleted) {
                continue;
            }
            if (occurrence.end.date() < from || occurrence.start.date() > to) {
                continue;
            }
            result.push_back(occurrence);
        }
    }
    std::sort(result.begin(), result.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    return result;
}

std::vector<Occurrence> InMemoryOccurrenceRepository::seriesParents() const
{
    std::vector<Occurrence> parents;
    {
        QMutexLocker locker(&m_mutex);
        for (const auto &occurrence : m_occurrences) {
            if (!occurrence.deleted && occurrence.isSeriesParent()) {
                parents.push_back(occurrence);
            }
        }
    }
    std::sort(parents.begin(), parents.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        return lhs.start < rhs.start;
    });
    return parents;
}

StoreStatus InMemoryOccurrenceRepository::insert(Occurrence &occurrence)
{
    if (occurrence.id.isNull()) {
        occurrence.id = QUuid::createUuid();
    }
    if (!occurrence.end.isValid() || occurrence.end < occurrence.start) {
        occurrence.end = occurrence.start;
    }
    if (occurrence.isInstance() && occurrence.rule) {
        qCWarning(lcPlannerData) << "Instance" << occurrence.id << "cannot carry a recurrence rule";
        return StoreStatus::Failed;
    }
    return write([this, &occurrence]() {
        if (m_occurrences.contains(occurrence.id)) {
            return StoreStatus::Failed;
        }
        if (hasAnchorClash(occurrence)) {
            return StoreStatus::DuplicateAnchor;
        }
        m_occurrences.insert(occurrence.id, occurrence);
        return StoreStatus::Ok;
    });
}

StoreStatus InMemoryOccurrenceRepository::update(const Occurrence &occurrence)
{
    if (occurrence.isInstance() && occurrence.rule) {
        qCWarning(lcPlannerData) << "Instance" << occurrence.id << "cannot carry a recurrence rule";
        return StoreStatus::Failed;
    }
    return write([this, &occurrence]() {
        if (!m_occurrences.contains(occurrence.id)) {
            return StoreStatus::NotFound;
        }
        if (hasAnchorClash(occurrence)) {
            return StoreStatus::DuplicateAnchor;
        }
        m_occurrences.insert(occurrence.id, occurrence);
        return StoreStatus::Ok;
    });
}

StoreStatus InMemoryOccurrenceRepository::remove(const QUuid &id)
{
    return write([this, &id]() {
        if (m_occurrences.remove(id) == 0) {
            return StoreStatus::NotFound;
        }
        for (auto it = m_reminders.begin(); it != m_reminders.end();) {
            if (it.value().occurrenceId == id) {
                it = m_reminders.erase(it);
            } else {
                ++it;
            }
        }
        return StoreStatus::Ok;
    });
}

StoreStatus InMemoryOccurrenceRepository::addReminder(CallReminder reminder)
{
    if (reminder.id.isNull()) {
        reminder.id = QUuid::createUuid();
    }
    return write([this, &reminder]() {
        if (!m_occurrences.contains(reminder.occurrenceId)) {
            return StoreStatus::NotFound;
        }
        m_reminders.insert(reminder.id, reminder);
        return StoreStatus::Ok;
    });
}

std::vector<CallReminder> InMemoryOccurrenceRepository::remindersFor(const QUuid &occurrenceId) const
{
    std::vector<CallReminder> reminders;
    QMutexLocker locker(&m_mutex);
    for (const auto &reminder : m_reminders) {
        if (reminder.occurrenceId == occurrenceId) {
            reminders.push_back(reminder);
        }
    }
    std::sort(reminders.begin(), reminders.end(), [](const CallReminder &lhs, const CallReminder &rhs) {
        return lhs.reminderDate < rhs.reminderDate;
    });
    return reminders;
}

bool InMemoryOccurrenceRepository::persist()
{
    return true;
}

bool InMemoryOccurrenceRepository::ownsTransaction() const
{
    QMutexLocker locker(&m_mutex);
    return m_inTransaction && m_transactionOwner == QThread::currentThread();
}

bool InMemoryOccurrenceRepository::hasAnchorClash(const Occurrence &occurrence) const
{
    if (!occurrence.isInstance()) {
        return false;
    }
    for (const auto &existing : m_occurrences) {
        if (existing.id != occurrence.id && existing.parentId == occurrence.parentId
            && existing.originalAnchor == occurrence.originalAnchor) {
            return true;
        }
    }
    return false;
}

} // namespace data
} // namespace planner

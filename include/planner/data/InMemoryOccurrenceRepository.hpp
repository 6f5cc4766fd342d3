#pragma once

#include <QHash>
#include <QMutex>

#include "planner/data/OccurrenceRepository.hpp"

class QThread;

namespace planner {
namespace data {

class InMemoryOccurrenceRepository : public OccurrenceRepository
{
public:
    InMemoryOccurrenceRepository();
    ~InMemoryOccurrenceRepository() override;

    bool beginTransaction() override;
    bool commit() override;
    void rollback() override;
    bool inTransaction() const override;

    std::optional<Occurrence> findById(const QUuid &id) const override;
    std::optional<Occurrence> findInstance(const QUuid &parentId, const QDateTime &originalAnchor) const override;
    std::vector<Occurrence> instancesOf(const QUuid &parentId, const InstanceFilter &filter = {}) const override;
    std::vector<Occurrence> fetchOccurrences(const QDate &from, const QDate &to) const override;
    std::vector<Occurrence> seriesParents() const override;

    StoreStatus insert(Occurrence &occurrence) override;
    StoreStatus update(const Occurrence &occurrence) override;
    StoreStatus remove(const QUuid &id) override;

    StoreStatus addReminder(CallReminder reminder) override;
    std::vector<CallReminder> remindersFor(const QUuid &occurrenceId) const override;

protected:
    // Called with the data lock held after a write outside a transaction and
    // on commit. Returning false undoes the change.
    virtual bool persist();

    QHash<QUuid, Occurrence> m_occurrences;
    QHash<QUuid, CallReminder> m_reminders;

private:
    bool ownsTransaction() const;
    bool hasAnchorClash(const Occurrence &occurrence) const;

    template<typename Write>
    StoreStatus write(Write &&apply);

    mutable QMutex m_mutex;
    QMutex m_writerLock;
    bool m_inTransaction = false;
    QThread *m_transactionOwner = nullptr;
    QHash<QUuid, Occurrence> m_occurrencesBackup;
    QHash<QUuid, CallReminder> m_remindersBackup;
};

} // namespace data
} // namespace planner

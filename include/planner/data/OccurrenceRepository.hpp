#pragma once

#include <optional>
#include <vector>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace data {

enum class StoreStatus
{
    Ok,
    NotFound,
    DuplicateAnchor,
    Failed,
};

const char *toString(StoreStatus status);

struct InstanceFilter
{
    std::optional<QDate> anchorFrom; // original anchor date >= anchorFrom
    bool includeDeleted = false;
    bool excludeTerminal = false;
    bool excludeCompleted = false;
};

class OccurrenceRepository
{
public:
    virtual ~OccurrenceRepository() = default;

    // Writes between beginTransaction() and commit() become visible together
    // or, after rollback(), not at all. Transactions do not nest.
    virtual bool beginTransaction() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;
    virtual bool inTransaction() const = 0;

    virtual std::optional<Occurrence> findById(const QUuid &id) const = 0;
    // Includes soft-deleted rows.
    virtual std::optional<Occurrence> findInstance(const QUuid &parentId, const QDateTime &originalAnchor) const = 0;
    // Ordered by original anchor.
    virtual std::vector<Occurrence> instancesOf(const QUuid &parentId, const InstanceFilter &filter = {}) const = 0;
    // Live rows overlapping [from, to], ordered by start.
    virtual std::vector<Occurrence> fetchOccurrences(const QDate &from, const QDate &to) const = 0;
    virtual std::vector<Occurrence> seriesParents() const = 0;

    // Instances are unique by (parentId, originalAnchor); a clash yields DuplicateAnchor.
    virtual StoreStatus insert(Occurrence &occurrence) = 0;
    virtual StoreStatus update(const Occurrence &occurrence) = 0;
    virtual StoreStatus remove(const QUuid &id) = 0;

    virtual StoreStatus addReminder(CallReminder reminder) = 0;
    virtual std::vector<CallReminder> remindersFor(const QUuid &occurrenceId) const = 0;
};

} // namespace data
} // namespace planner

#pragma once

#include <QDate>
#include <QString>
#include <QUuid>
#include <optional>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace data {
class OccurrenceRepository;
}

namespace recurrence {

class SeriesGenerator;

enum class DeleteScope
{
    ThisOnly,
    ThisAndFuture,
    All,
};

// "this_only", "this_and_future" (or "future") and "all"; anything else is this_only.
DeleteScope deleteScopeFromString(const QString &value);
QString toString(DeleteScope scope);

struct LifecycleResult
{
    bool ok = false;
    QString error;
    int affected = 0;
};

struct TrimOptions
{
    int horizonYears = 3;
    int minInstances = 24;
    bool dryRun = false;
    bool convertToForever = false;
};

struct TrimReport
{
    int seriesAffected = 0;
    int instancesTrimmed = 0;
    int seriesConverted = 0;
};

// Scope-limited mutations of a stored series. Every operation runs in its own
// transaction and leaves completed instances alone unless the scope is "all".
class SeriesLifecycle
{
public:
    SeriesLifecycle(data::OccurrenceRepository &repository, SeriesGenerator &generator);

    LifecycleResult deleteOccurrence(const QUuid &targetId, DeleteScope scope);
    LifecycleResult cancelFutureRecurrences(const QUuid &parentId, const QDate &fromDate);
    LifecycleResult changeRule(const QUuid &parentId, const std::optional<data::RecurrenceRule> &rule);
    // Copies business fields to the live, non-terminal instances (all, or
    // those anchored on or after fromDate).
    LifecycleResult updateInstances(const QUuid &parentId, const data::JobSnapshot &snapshot,
                                    const std::optional<QDate> &fromDate = std::nullopt);
    TrimReport trim(const TrimOptions &options, const QDate &today);

private:
    bool softDelete(data::Occurrence occurrence, int &affected);
    LifecycleResult deleteThisAndFuture(const data::Occurrence &target, data::Occurrence parent);
    std::optional<int> regenerateInTransaction(const data::Occurrence &parent);

    data::OccurrenceRepository &m_repository;
    SeriesGenerator &m_generator;
};

} // namespace recurrence
} // namespace planner

#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <vector>

#include "planner/core/RecurrenceSettings.hpp"
#include "planner/data/Occurrence.hpp"
#include "planner/recurrence/Materializer.hpp"
#include "planner/recurrence/SeriesGenerator.hpp"
#include "planner/recurrence/SeriesLifecycle.hpp"
#include "planner/recurrence/WindowExpander.hpp"

namespace planner {
namespace data {
class InstanceCreatedHook;
class OccurrenceRepository;
}

namespace core {

struct CalendarEntry
{
    data::Occurrence occurrence; // id is null for virtual entries
    bool isVirtual = false;
    std::optional<int> ordinal;
};

struct SeriesResult
{
    std::optional<data::Occurrence> parent;
    std::vector<data::Occurrence> instances;
    QString error;

    bool ok() const { return parent.has_value(); }
};

struct PreviewResult
{
    std::vector<recurrence::VirtualOccurrence> occurrences;
    bool hasMore = false;
    QString error;

    bool ok() const { return error.isEmpty(); }
};

// Entry point for callers holding occurrence ids: wires the recurrence
// engine to one store and reads every row it works on from that store.
class SeriesService
{
public:
    SeriesService(data::OccurrenceRepository &repository, RecurrenceSettings settings,
                  data::InstanceCreatedHook *hook = nullptr);

    const RecurrenceSettings &settings() const;

    // Stores a new occurrence; finite series get their instances in the same transaction.
    SeriesResult createSeries(data::Occurrence parent);

    // Stored occurrences plus virtual ones of forever series in [from, to], by start.
    std::vector<CalendarEntry> occurrencesInWindow(const QDate &from, const QDate &to) const;
    // Next `count` virtual occurrences of a forever series dated after `after`.
    PreviewResult preview(const QUuid &parentId, const QDate &after, int count = 0) const;
    std::optional<int> ordinal(const QUuid &occurrenceId) const;
    std::optional<QString> summary(const QUuid &parentId) const;

    recurrence::MaterializeResult materialize(const QUuid &parentId, const QDateTime &originalAnchor);
    recurrence::LifecycleResult deleteOccurrence(const QUuid &occurrenceId, recurrence::DeleteScope scope);
    // Accepts the parent or any of its instances.
    recurrence::LifecycleResult cancelFuture(const QUuid &occurrenceId, const QDate &fromDate);
    recurrence::LifecycleResult changeRule(const QUuid &parentId, const std::optional<data::RecurrenceRule> &rule);
    recurrence::LifecycleResult updateInstances(const QUuid &parentId, const data::JobSnapshot &snapshot,
                                                const std::optional<QDate> &fromDate = std::nullopt);
    recurrence::TrimReport trim(const recurrence::TrimOptions &options, const QDate &today);

private:
    std::optional<int> ordinalOf(const data::Occurrence &occurrence, const data::Occurrence *parent) const;

    data::OccurrenceRepository &m_repository;
    RecurrenceSettings m_settings;
    recurrence::SeriesGenerator m_generator;
    recurrence::Materializer m_materializer;
    recurrence::SeriesLifecycle m_lifecycle;
};

} // namespace core
} // namespace planner

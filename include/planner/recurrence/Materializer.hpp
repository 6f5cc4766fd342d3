#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace data {
class InstanceCreatedHook;
class OccurrenceRepository;
}

namespace recurrence {

struct MaterializeResult
{
    std::optional<data::Occurrence> occurrence;
    bool wasCreated = false;
    QString error;

    bool ok() const { return occurrence.has_value(); }
};

// Turns a virtual occurrence into a stored instance, at most once per
// (parent, original anchor).
class Materializer
{
public:
    explicit Materializer(data::OccurrenceRepository &repository, data::InstanceCreatedHook *hook = nullptr);

    // Returns the existing instance for the slot (soft-deleted ones included)
    // or creates it. A concurrent writer that wins the slot first is detected
    // through the store's uniqueness check and its row is returned instead.
    MaterializeResult materialize(const data::Occurrence &parent, const QDateTime &originalAnchor);

    static QDateTime normalizeAnchor(const data::Occurrence &parent, const QDateTime &originalAnchor);

private:
    enum class Attempt
    {
        Created,
        Found,
        Conflict,
        Failed,
    };

    Attempt findOrCreate(const data::Occurrence &parent, const QDateTime &anchor, MaterializeResult &result);

    data::OccurrenceRepository &m_repository;
    data::InstanceCreatedHook *m_hook = nullptr;
};

} // namespace recurrence
} // namespace planner

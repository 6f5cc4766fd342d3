#pragma once

#include <QDate>
#include <QDateTime>
#include <QUuid>
#include <vector>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace recurrence {

// Computed on demand, never stored.
struct VirtualOccurrence
{
    QUuid parentId;
    QDateTime originalAnchor;
    QDateTime start;
    QDateTime end;
    int ordinal = 0; // 0 for the parent itself, counting up from 1 otherwise
    bool isParent = false;
};

class WindowExpander
{
public:
    static constexpr int kDefaultSafetyCap = 200;

    // Occurrences of `parent` whose anchor date lies within
    // [windowStart, windowEnd], clamped to the effective cutoff and truncated
    // after safetyCap entries. No storage access.
    static std::vector<VirtualOccurrence> expand(const data::Occurrence &parent, const data::RecurrenceRule &rule,
                                                 const QDate &windowStart, const QDate &windowEnd,
                                                 int safetyCap = kDefaultSafetyCap);
};

} // namespace recurrence
} // namespace planner

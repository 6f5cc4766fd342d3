#pragma once

#include <QDateTime>
#include <optional>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace recurrence {

class OccurrenceLocator
{
public:
    static constexpr int kDefaultSafetyCap = 502;

    // 1-based position of the occurrence anchored at `instanceAnchor`, the
    // parent being 1. Re-runs the same stepping used for generation and
    // matches on calendar date. None when the date is skipped over or the
    // cap runs out.
    static std::optional<int> ordinal(const data::Occurrence &parent, const QDateTime &instanceAnchor,
                                      int safetyCap = kDefaultSafetyCap);
};

} // namespace recurrence
} // namespace planner

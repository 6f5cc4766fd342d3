#pragma once

#include <QDateTime>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace recurrence {

// Builds an unsaved instance of `parent` anchored at `anchor`, keeping the
// parent's duration. Business fields are copied; status resets to
// uncompleted, rule fields are cleared and the call reminder keeps its
// schedule but not its completion.
data::Occurrence makeInstance(const data::Occurrence &parent, const QDateTime &anchor);

} // namespace recurrence
} // namespace planner

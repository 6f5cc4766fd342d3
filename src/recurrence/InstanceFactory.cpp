#include "planner/recurrence/InstanceFactory.hpp"

namespace planner {
namespace recurrence {

data::Occurrence makeInstance(const data::Occurrence &parent, const QDateTime &anchor)
{
    data::Occurrence instance;
    instance.parentId = parent.id;
    instance.originalAnchor = anchor;
    instance.calendar = parent.calendar;
    instance.start = anchor;
    instance.end = anchor.addSecs(parent.durationSecs());
    instance.allDay = parent.allDay;
    instance.status = data::OccurrenceStatus::Uncompleted;
    instance.snapshot = parent.snapshot;
    instance.callReminder.enabled = parent.callReminder.enabled;
    instance.callReminder.weeksPrior = parent.callReminder.weeksPrior;
    instance.callReminder.completed = false;
    return instance;
}

} // namespace recurrence
} // namespace planner

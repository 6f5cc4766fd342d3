#pragma once

#include <QDate>
#include <QDateTime>

#include "planner/data/InstanceCreatedHook.hpp"

namespace planner {
namespace core {

// Sunday of the week containing `start`, moved back weeksPrior - 1 weeks.
QDate callReminderSunday(const QDateTime &start, int weeksPrior);

// Stores a call reminder for every new instance that asks for one.
class CallReminderHook : public data::InstanceCreatedHook
{
public:
    bool onInstanceCreated(const data::Occurrence &instance, data::OccurrenceRepository &repository) override;
};

} // namespace core
} // namespace planner

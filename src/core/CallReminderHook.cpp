#include "planner/core/CallReminderHook.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/OccurrenceRepository.hpp"

namespace planner {
namespace core {

QDate callReminderSunday(const QDateTime &start, int weeksPrior)
{
    const QDate date = start.date();
    const QDate weekSunday = date.addDays(-(date.dayOfWeek() % 7));
    return weekSunday.addDays(-7 * static_cast<qint64>(weeksPrior - 1));
}

bool CallReminderHook::onInstanceCreated(const data::Occurrence &instance, data::OccurrenceRepository &repository)
{
    if (!instance.callReminder.enabled || instance.callReminder.weeksPrior <= 0) {
        return true;
    }

    data::CallReminder reminder;
    reminder.occurrenceId = instance.id;
    reminder.calendar = instance.calendar;
    reminder.reminderDate = callReminderSunday(instance.start, instance.callReminder.weeksPrior);
    const data::StoreStatus status = repository.addReminder(reminder);
    if (status != data::StoreStatus::Ok) {
        qCWarning(lcPlannerCore) << "Creating call reminder for" << instance.id << "failed:" << data::toString(status);
        return false;
    }
    qCDebug(lcPlannerCore) << "Created call reminder for recurring instance" << instance.id << "on"
                           << reminder.reminderDate;
    return true;
}

} // namespace core
} // namespace planner

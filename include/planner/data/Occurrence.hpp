#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "planner/data/RecurrenceRule.hpp"

namespace planner {
namespace data {

enum class OccurrenceStatus
{
    Uncompleted,
    Completed,
    Canceled,
};

inline bool isTerminal(OccurrenceStatus status)
{
    return status == OccurrenceStatus::Completed || status == OccurrenceStatus::Canceled;
}

// Business fields copied from a series parent to each of its instances.
// Bump kVersion when fields are added so stored snapshots can be migrated.
struct JobSnapshot
{
    static constexpr int kVersion = 1;

    QString businessName;
    QString contactName;
    QString phone;
    QString addressLine1;
    QString addressLine2;
    QString city;
    QString state;
    QString postalCode;
    QString notes;
    QString repairNotes;
    QString trailerColor;
    QString trailerSerial;
    QString trailerDetails;
    QString quote;
    QString quoteText;
    bool trailerColorOverwrite = false;
    QString createdBy;
};

bool operator==(const JobSnapshot &lhs, const JobSnapshot &rhs);

struct CallReminderSettings
{
    bool enabled = false;
    int weeksPrior = 0;
    bool completed = false;
};

struct Occurrence
{
    QUuid id = QUuid::createUuid();
    QString calendar;
    QDateTime start;
    QDateTime end;
    bool allDay = false;
    OccurrenceStatus status = OccurrenceStatus::Uncompleted;
    JobSnapshot snapshot;
    CallReminderSettings callReminder;

    // Series parent only.
    std::optional<RecurrenceRule> rule;
    std::optional<QDate> seriesEndOverride;

    // Instances only.
    QUuid parentId;
    QDateTime originalAnchor;

    bool deleted = false;

    bool isInstance() const { return !parentId.isNull(); }
    bool isSeriesParent() const { return parentId.isNull() && rule.has_value(); }
    qint64 durationSecs() const { return start.secsTo(end); }
};

struct CallReminder
{
    QUuid id = QUuid::createUuid();
    QUuid occurrenceId;
    QString calendar;
    QDate reminderDate;
    QString notes;
    bool completed = false;
};

} // namespace data
} // namespace planner

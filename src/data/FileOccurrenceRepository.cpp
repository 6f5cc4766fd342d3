#include "planner/data/FileOccurrenceRepository.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/RuleCodec.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <QTime>
#include <QTimeZone>
#include <algorithm>
#include <iterator>

namespace planner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto LOCAL_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

struct SnapshotField
{
    const char *property;
    QString JobSnapshot::*member;
};

const SnapshotField kSnapshotFields[] = {
    {"X-PLANNER-CONTACT", &JobSnapshot::contactName},
    {"X-PLANNER-PHONE", &JobSnapshot::phone},
    {"X-PLANNER-ADDRESS1", &JobSnapshot::addressLine1},
    {"X-PLANNER-ADDRESS2", &JobSnapshot::addressLine2},
    {"X-PLANNER-CITY", &JobSnapshot::city},
    {"X-PLANNER-STATE", &JobSnapshot::state},
    {"X-PLANNER-POSTAL-CODE", &JobSnapshot::postalCode},
    {"DESCRIPTION", &JobSnapshot::notes},
    {"X-PLANNER-REPAIR-NOTES", &JobSnapshot::repairNotes},
    {"X-PLANNER-TRAILER-COLOR", &JobSnapshot::trailerColor},
    {"X-PLANNER-TRAILER-SERIAL", &JobSnapshot::trailerSerial},
    {"X-PLANNER-TRAILER-DETAILS", &JobSnapshot::trailerDetails},
    {"X-PLANNER-QUOTE", &JobSnapshot::quote},
    {"X-PLANNER-QUOTE-TEXT", &JobSnapshot::quoteText},
    {"X-PLANNER-CREATED-BY", &JobSnapshot::createdBy},
};

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    return QUuid(QStringLiteral("{%1}").arg(value.trimmed()));
}

bool parseFlag(const QString &value)
{
    return value.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
}

const char *flag(bool value)
{
    return value ? "TRUE" : "FALSE";
}
} // namespace

FileOccurrenceRepository::FileOccurrenceRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileOccurrenceRepository::filePath() const
{
    return m_filePath;
}

bool FileOccurrenceRepository::persist()
{
    return save();
}

void FileOccurrenceRepository::load()
{
    m_occurrences.clear();
    m_reminders.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcPlannerData) << "Cannot open" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Occurrence,
        Reminder
    };

    Section currentSection = Section::None;
    Occurrence currentOccurrence;
    CallReminder currentReminder;

    auto finalizeOccurrence = [&]() {
        if (currentOccurrence.id.isNull() || !currentOccurrence.start.isValid()) {
            qCWarning(lcPlannerData) << "Skipping occurrence without UID or DTSTART in" << m_filePath;
            return;
        }
        if (!currentOccurrence.end.isValid() || currentOccurrence.end < currentOccurrence.start) {
            currentOccurrence.end = currentOccurrence.start;
        }
        if (currentOccurrence.isInstance()) {
            currentOccurrence.rule.reset();
            currentOccurrence.seriesEndOverride.reset();
        }
        m_occurrences.insert(currentOccurrence.id, currentOccurrence);
    };

    auto finalizeReminder = [&]() {
        if (currentReminder.id.isNull() || currentReminder.occurrenceId.isNull()) {
            return;
        }
        m_reminders.insert(currentReminder.id, currentReminder);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Occurrence;
            currentOccurrence = Occurrence{};
            currentOccurrence.id = QUuid();
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeOccurrence();
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:VTODO")) {
            currentSection = Section::Reminder;
            currentReminder = CallReminder{};
            currentReminder.id = QUuid();
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            finalizeReminder();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);

        const bool dateOnlyParam = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive);

        if (currentSection == Section::Reminder) {
            if (name == QLatin1String("UID")) {
                currentReminder.id = parseUid(value);
            } else if (name == QLatin1String("RELATED-TO")) {
                currentReminder.occurrenceId = parseUid(value);
            } else if (name == QLatin1String("DUE")) {
                currentReminder.reminderDate = QDate::fromString(rawValue.left(8), DATE_FORMAT);
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentReminder.notes = value;
            } else if (name == QLatin1String("STATUS")) {
                currentReminder.completed = rawValue.compare(QLatin1String("COMPLETED"), Qt::CaseInsensitive) == 0;
            } else if (name == QLatin1String("X-PLANNER-CALENDAR")) {
                currentReminder.calendar = value;
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            currentOccurrence.id = parseUid(value);
        } else if (name == QLatin1String("SUMMARY")) {
            currentOccurrence.snapshot.businessName = value;
        } else if (name == QLatin1String("X-PLANNER-CALENDAR")) {
            currentOccurrence.calendar = value;
        } else if (name == QLatin1String("DTSTART")) {
            currentOccurrence.start = parseDateTime(rawValue, parameters);
            currentOccurrence.allDay = dateOnlyParam || rawValue.size() == 8;
            if (currentOccurrence.allDay && currentOccurrence.start.isValid()) {
                currentOccurrence.start.setTime(QTime(0, 0));
            }
        } else if (name == QLatin1String("DTEND")) {
            currentOccurrence.end = parseDateTime(rawValue, parameters);
            if (currentOccurrence.allDay && currentOccurrence.end.isValid()) {
                currentOccurrence.end.setTime(QTime(0, 0));
            }
        } else if (name == QLatin1String("STATUS")) {
            currentOccurrence.status = statusFromString(rawValue);
        } else if (name == QLatin1String("RECURRENCE-ID")) {
            currentOccurrence.originalAnchor = parseDateTime(rawValue, parameters);
        } else if (name == QLatin1String("X-PLANNER-PARENT")) {
            currentOccurrence.parentId = parseUid(value);
        } else if (name == QLatin1String("X-PLANNER-RULE")) {
            const RuleParseResult parsed = RuleCodec::parse(value);
            if (!parsed.ok()) {
                qCWarning(lcPlannerData) << "Ignoring rule of" << currentOccurrence.id << parsed.error;
            }
            currentOccurrence.rule = parsed.rule;
        } else if (name == QLatin1String("X-PLANNER-SERIES-END")) {
            const QDate seriesEnd = QDate::fromString(rawValue, DATE_FORMAT);
            if (seriesEnd.isValid()) {
                currentOccurrence.seriesEndOverride = seriesEnd;
            }
        } else if (name == QLatin1String("X-PLANNER-DELETED")) {
            currentOccurrence.deleted = parseFlag(rawValue);
        } else if (name == QLatin1String("X-PLANNER-ALLDAY")) {
            currentOccurrence.allDay = parseFlag(rawValue);
        } else if (name == QLatin1String("X-PLANNER-TRAILER-COLOR-OVERWRITE")) {
            currentOccurrence.snapshot.trailerColorOverwrite = parseFlag(rawValue);
        } else if (name == QLatin1String("X-PLANNER-REMINDER-ENABLED")) {
            currentOccurrence.callReminder.enabled = parseFlag(rawValue);
        } else if (name == QLatin1String("X-PLANNER-REMINDER-WEEKS")) {
            currentOccurrence.callReminder.weeksPrior = rawValue.toInt();
        } else if (name == QLatin1String("X-PLANNER-REMINDER-COMPLETED")) {
            currentOccurrence.callReminder.completed = parseFlag(rawValue);
        } else {
            const auto field = std::find_if(std::begin(kSnapshotFields), std::end(kSnapshotFields),
                                            [&name](const SnapshotField &candidate) {
                                                return name == QLatin1String(candidate.property);
                                            });
            if (field != std::end(kSnapshotFields)) {
                currentOccurrence.snapshot.*(field->member) = value;
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcPlannerData) << "Loaded" << m_occurrences.size() << "occurrences and" << m_reminders.size()
                           << "reminders from" << m_filePath;
}

bool FileOccurrenceRepository::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerData) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcPlannerData) << "Cannot write" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Series Planner//EN\n";

    auto occurrences = m_occurrences.values();
    std::sort(occurrences.begin(), occurrences.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.id < rhs.id;
        }
        return lhs.start < rhs.start;
    });
    for (const Occurrence &occurrence : occurrences) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << prepareUid(occurrence.id) << '\n';
        stream << "SUMMARY:" << encodeText(occurrence.snapshot.businessName) << '\n';
        if (!occurrence.calendar.isEmpty()) {
            stream << "X-PLANNER-CALENDAR:" << encodeText(occurrence.calendar) << '\n';
        }
        if (occurrence.allDay) {
            stream << "DTSTART;VALUE=DATE:" << occurrence.start.date().toString(DATE_FORMAT) << '\n';
            stream << "DTEND;VALUE=DATE:" << occurrence.end.date().toString(DATE_FORMAT) << '\n';
            stream << "X-PLANNER-ALLDAY:TRUE\n";
        } else {
            stream << "DTSTART" << formatDateTime(occurrence.start) << '\n';
            stream << "DTEND" << formatDateTime(occurrence.end) << '\n';
        }
        stream << "STATUS:" << statusToString(occurrence.status) << '\n';
        if (occurrence.isInstance()) {
            stream << "X-PLANNER-PARENT:" << prepareUid(occurrence.parentId) << '\n';
            stream << "RECURRENCE-ID" << formatDateTime(occurrence.originalAnchor) << '\n';
        }
        if (occurrence.rule) {
            stream << "X-PLANNER-RULE:" << encodeText(RuleCodec::toCompactJson(*occurrence.rule)) << '\n';
        }
        if (occurrence.seriesEndOverride) {
            stream << "X-PLANNER-SERIES-END:" << occurrence.seriesEndOverride->toString(DATE_FORMAT) << '\n';
        }
        if (occurrence.deleted) {
            stream << "X-PLANNER-DELETED:TRUE\n";
        }
        for (const SnapshotField &field : kSnapshotFields) {
            const QString &value = occurrence.snapshot.*(field.member);
            if (!value.isEmpty()) {
                stream << field.property << ':' << encodeText(value) << '\n';
            }
        }
        if (occurrence.snapshot.trailerColorOverwrite) {
            stream << "X-PLANNER-TRAILER-COLOR-OVERWRITE:TRUE\n";
        }
        if (occurrence.callReminder.enabled) {
            stream << "X-PLANNER-REMINDER-ENABLED:TRUE\n";
            stream << "X-PLANNER-REMINDER-WEEKS:" << occurrence.callReminder.weeksPrior << '\n';
            stream << "X-PLANNER-REMINDER-COMPLETED:" << flag(occurrence.callReminder.completed) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    auto reminders = m_reminders.values();
    std::sort(reminders.begin(), reminders.end(), [](const CallReminder &lhs, const CallReminder &rhs) {
        return lhs.reminderDate < rhs.reminderDate;
    });
    for (const CallReminder &reminder : reminders) {
        stream << "BEGIN:VTODO\n";
        stream << "UID:" << prepareUid(reminder.id) << '\n';
        stream << "RELATED-TO:" << prepareUid(reminder.occurrenceId) << '\n';
        stream << "DUE;VALUE=DATE:" << reminder.reminderDate.toString(DATE_FORMAT) << '\n';
        if (!reminder.calendar.isEmpty()) {
            stream << "X-PLANNER-CALENDAR:" << encodeText(reminder.calendar) << '\n';
        }
        if (!reminder.notes.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(reminder.notes) << '\n';
        }
        stream << "STATUS:" << (reminder.completed ? "COMPLETED" : "NEEDS-ACTION") << '\n';
        stream << "END:VTODO\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcPlannerData) << "Cannot commit" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QString FileOccurrenceRepository::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileOccurrenceRepository::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch == QLatin1Char('\\') && i + 1 < text.size()) {
            const QChar next = text.at(++i);
            if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
                decoded += QLatin1Char('\n');
            } else {
                decoded += next;
            }
        } else {
            decoded += ch;
        }
    }
    return decoded;
}

// Parameters and value of a date-time property, starting at the character
// after the property name. Zoned values keep their wall-clock time and TZID;
// local values are written floating.
QString FileOccurrenceRepository::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QStringLiteral(":");
    }
    switch (dt.timeSpec()) {
    case Qt::TimeZone:
        return QStringLiteral(";TZID=%1:%2")
            .arg(QString::fromUtf8(dt.timeZone().id()), dt.toString(QLatin1String(LOCAL_DATE_TIME_FORMAT)));
    case Qt::OffsetFromUTC:
        return QStringLiteral(";X-PLANNER-OFFSET=%1:%2")
            .arg(dt.offsetFromUtc())
            .arg(dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT)));
    case Qt::UTC:
        return QLatin1Char(':') + dt.toString(QLatin1String(DATE_TIME_FORMAT));
    case Qt::LocalTime:
    default:
        return QLatin1Char(':') + dt.toString(QLatin1String(LOCAL_DATE_TIME_FORMAT));
    }
}

QDateTime FileOccurrenceRepository::parseDateTime(const QString &value, const QString &parameters)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return QDateTime(date.startOfDay());
    }

    QString zoneId;
    std::optional<int> offset;
    for (const QString &parameter : parameters.split(';', Qt::SkipEmptyParts)) {
        const QString key = parameter.section('=', 0, 0).trimmed().toUpper();
        QString argument = parameter.section('=', 1).trimmed();
        if (argument.startsWith('"') && argument.endsWith('"') && argument.size() >= 2) {
            argument = argument.mid(1, argument.size() - 2);
        }
        if (key == QLatin1String("TZID")) {
            zoneId = argument;
        } else if (key == QLatin1String("X-PLANNER-OFFSET")) {
            bool ok = false;
            const int seconds = argument.toInt(&ok);
            if (ok) {
                offset = seconds;
            }
        }
    }

    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        if (offset) {
            return dt.toOffsetFromUtc(*offset);
        }
        return dt;
    }
    QDateTime dt = QDateTime::fromString(value, LOCAL_DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        return QDateTime::fromString(value, Qt::ISODate);
    }
    if (!zoneId.isEmpty()) {
        const QTimeZone zone(zoneId.toUtf8());
        if (zone.isValid()) {
            dt.setTimeZone(zone);
        } else {
            qCWarning(lcPlannerData) << "Unknown time zone" << zoneId << "read as local time";
        }
    }
    return dt;
}

QString FileOccurrenceRepository::statusToString(OccurrenceStatus status)
{
    switch (status) {
    case OccurrenceStatus::Completed:
        return QStringLiteral("COMPLETED");
    case OccurrenceStatus::Canceled:
        return QStringLiteral("CANCELLED");
    case OccurrenceStatus::Uncompleted:
    default:
        return QStringLiteral("CONFIRMED");
    }
}

OccurrenceStatus FileOccurrenceRepository::statusFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("COMPLETED")) {
        return OccurrenceStatus::Completed;
    }
    if (normalized == QLatin1String("CANCELLED") || normalized == QLatin1String("CANCELED")) {
        return OccurrenceStatus::Canceled;
    }
    return OccurrenceStatus::Uncompleted;
}

} // namespace data
} // namespace planner

#include "planner/data/RuleCodec.hpp"

#include "planner/core/Logging.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace planner {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

struct FrequencyNameVisitor
{
    QString operator()(const Daily &) const { return QStringLiteral("daily"); }
    QString operator()(const Weekly &) const { return QStringLiteral("weekly"); }
    QString operator()(const Monthly &) const { return QStringLiteral("monthly"); }
    QString operator()(const Yearly &) const { return QStringLiteral("yearly"); }
};

std::optional<int> readInt(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double number = value.toDouble();
        const int integer = static_cast<int>(number);
        if (static_cast<double>(integer) != number) {
            return std::nullopt;
        }
        return integer;
    }
    if (value.isString()) {
        bool ok = false;
        const int integer = value.toString().trimmed().toInt(&ok);
        if (ok) {
            return integer;
        }
    }
    return std::nullopt;
}

QDate readDate(const QString &value)
{
    const QString trimmed = value.trimmed();
    QDate date = QDate::fromString(trimmed, Qt::ISODate);
    if (date.isValid()) {
        return date;
    }
    QString normalized = trimmed;
    if (normalized.endsWith(QLatin1Char('Z'))) {
        normalized.chop(1);
    }
    const QDateTime dateTime = QDateTime::fromString(normalized, Qt::ISODate);
    return dateTime.isValid() ? dateTime.date() : QDate();
}

RuleParseResult failure(const QString &message)
{
    qCWarning(lcPlannerRecurrence).noquote() << message;
    RuleParseResult result;
    result.error = message;
    return result;
}
} // namespace

RuleParseResult RuleCodec::parse(const QJsonObject &record)
{
    const QJsonValue typeValue = record.value(QStringLiteral("type"));
    const QString typeName = typeValue.isString() ? typeValue.toString().trimmed().toLower() : QString();
    if (typeName.isEmpty() || typeName == QLatin1String("none")) {
        return {};
    }

    const auto frequency = frequencyFromName(typeName);
    if (!frequency) {
        return failure(QStringLiteral("Unknown recurrence type: %1").arg(typeName));
    }

    RecurrenceRule rule;
    rule.frequency = *frequency;

    const QJsonValue intervalValue = record.value(QStringLiteral("interval"));
    if (!intervalValue.isUndefined() && !intervalValue.isNull()) {
        const auto interval = readInt(intervalValue);
        if (!interval || *interval < 1) {
            return failure(QStringLiteral("Recurrence interval must be a whole number of at least 1"));
        }
        rule.interval = *interval;
    }

    if (record.value(QStringLiteral("end")).toString() == QLatin1String("never")) {
        rule.endNever = true;
        RuleParseResult result;
        result.rule = rule;
        return result;
    }

    const QJsonValue countValue = record.value(QStringLiteral("count"));
    if (!countValue.isUndefined() && !countValue.isNull()) {
        const auto count = readInt(countValue);
        if (!count || *count < 1 || *count > kMaxCount) {
            return failure(QStringLiteral("Recurrence count must be between 1 and %1").arg(kMaxCount));
        }
        rule.count = *count;
    }

    const QJsonValue untilValue = record.value(QStringLiteral("until_date"));
    if (!untilValue.isUndefined() && !untilValue.isNull()) {
        const QDate until = untilValue.isString() ? readDate(untilValue.toString()) : QDate();
        if (!until.isValid()) {
            return failure(QStringLiteral("Malformed until_date: %1").arg(untilValue.toVariant().toString()));
        }
        rule.untilDate = until;
    }

    RuleParseResult result;
    result.rule = rule;
    return result;
}

RuleParseResult RuleCodec::parse(const QString &json)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(json.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return failure(QStringLiteral("Malformed recurrence record: %1").arg(error.errorString()));
    }
    return parse(document.object());
}

QJsonObject RuleCodec::toJson(const RecurrenceRule &rule)
{
    QJsonObject record;
    record.insert(QStringLiteral("type"), frequencyName(rule.frequency));
    record.insert(QStringLiteral("interval"), rule.interval);
    record.insert(QStringLiteral("count"), rule.count ? QJsonValue(*rule.count) : QJsonValue());
    record.insert(QStringLiteral("until_date"),
                  rule.untilDate ? QJsonValue(rule.untilDate->toString(QLatin1String(DATE_FORMAT))) : QJsonValue());
    record.insert(QStringLiteral("end"), rule.endNever ? QJsonValue(QStringLiteral("never")) : QJsonValue());
    return record;
}

QString RuleCodec::toCompactJson(const RecurrenceRule &rule)
{
    return QString::fromUtf8(QJsonDocument(toJson(rule)).toJson(QJsonDocument::Compact));
}

QString RuleCodec::frequencyName(const Frequency &frequency)
{
    return std::visit(FrequencyNameVisitor{}, frequency);
}

std::optional<Frequency> RuleCodec::frequencyFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("daily")) {
        return Frequency{Daily{}};
    }
    if (normalized == QLatin1String("weekly")) {
        return Frequency{Weekly{}};
    }
    if (normalized == QLatin1String("monthly")) {
        return Frequency{Monthly{}};
    }
    if (normalized == QLatin1String("yearly")) {
        return Frequency{Yearly{}};
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner

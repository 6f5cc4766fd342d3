#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

#include "planner/data/RecurrenceRule.hpp"

namespace planner {
namespace data {

struct RuleParseResult
{
    // No rule and no error: the record says the occurrence does not recur.
    std::optional<RecurrenceRule> rule;
    QString error;

    bool ok() const { return error.isEmpty(); }
};

// Converts between RecurrenceRule and the persisted record
// {type, interval, count, until_date, end}.
class RuleCodec
{
public:
    static constexpr int kMaxCount = 500;

    static RuleParseResult parse(const QJsonObject &record);
    static RuleParseResult parse(const QString &json);
    static QJsonObject toJson(const RecurrenceRule &rule);
    static QString toCompactJson(const RecurrenceRule &rule);

    static QString frequencyName(const Frequency &frequency);
    static std::optional<Frequency> frequencyFromName(const QString &name);
};

} // namespace data
} // namespace planner

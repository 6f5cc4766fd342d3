#include "planner/core/RecurrenceSettings.hpp"

#include "planner/core/Logging.hpp"

#include <QSettings>

namespace planner {
namespace core {

namespace {
void readPositive(const QSettings &settings, const QString &key, int &target)
{
    if (!settings.contains(key)) {
        return;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcPlannerCore) << "Ignoring invalid setting" << key << settings.value(key);
        return;
    }
    target = value;
}
} // namespace

RecurrenceSettings RecurrenceSettings::load(const QSettings &settings)
{
    RecurrenceSettings result;
    readPositive(settings, QStringLiteral("recurrence/windowSafetyCap"), result.windowSafetyCap);
    readPositive(settings, QStringLiteral("recurrence/ordinalSafetyCap"), result.ordinalSafetyCap);
    readPositive(settings, QStringLiteral("recurrence/defaultGenerationCount"), result.defaultGenerationCount);
    readPositive(settings, QStringLiteral("recurrence/previewDefaultCount"), result.previewDefaultCount);
    readPositive(settings, QStringLiteral("recurrence/previewMaxCount"), result.previewMaxCount);
    readPositive(settings, QStringLiteral("recurrence/previewStepCap"), result.previewStepCap);
    readPositive(settings, QStringLiteral("recurrence/trimHorizonYears"), result.trimHorizonYears);
    readPositive(settings, QStringLiteral("recurrence/trimMinInstances"), result.trimMinInstances);
    result.storagePath = settings.value(QStringLiteral("storage/path")).toString();
    result.loggingRules = settings.value(QStringLiteral("logging/rules")).toString();
    return result;
}

void RecurrenceSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("recurrence/windowSafetyCap"), windowSafetyCap);
    settings.setValue(QStringLiteral("recurrence/ordinalSafetyCap"), ordinalSafetyCap);
    settings.setValue(QStringLiteral("recurrence/defaultGenerationCount"), defaultGenerationCount);
    settings.setValue(QStringLiteral("recurrence/previewDefaultCount"), previewDefaultCount);
    settings.setValue(QStringLiteral("recurrence/previewMaxCount"), previewMaxCount);
    settings.setValue(QStringLiteral("recurrence/previewStepCap"), previewStepCap);
    settings.setValue(QStringLiteral("recurrence/trimHorizonYears"), trimHorizonYears);
    settings.setValue(QStringLiteral("recurrence/trimMinInstances"), trimMinInstances);
    if (!storagePath.isEmpty()) {
        settings.setValue(QStringLiteral("storage/path"), storagePath);
    }
    if (!loggingRules.isEmpty()) {
        settings.setValue(QStringLiteral("logging/rules"), loggingRules);
    }
}

void RecurrenceSettings::applyLoggingRules() const
{
    if (loggingRules.isEmpty()) {
        return;
    }
    // Settings store one rule per ';' to keep the value on a single line.
    QString rules = loggingRules;
    rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
    QLoggingCategory::setFilterRules(rules);
}

} // namespace core
} // namespace planner

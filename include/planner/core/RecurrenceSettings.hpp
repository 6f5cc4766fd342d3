#pragma once

#include <QString>

class QSettings;

namespace planner {
namespace core {

struct RecurrenceSettings
{
    int windowSafetyCap = 200;
    int ordinalSafetyCap = 502;
    int defaultGenerationCount = 50;
    int previewDefaultCount = 5;
    int previewMaxCount = 200;
    int previewStepCap = 2000; // steps walked per preview, skipped slots included
    int trimHorizonYears = 3;
    int trimMinInstances = 24;
    QString storagePath; // empty selects the application data location
    QString loggingRules;

    // Missing or non-positive values keep their defaults.
    static RecurrenceSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
    void applyLoggingRules() const;
};

} // namespace core
} // namespace planner

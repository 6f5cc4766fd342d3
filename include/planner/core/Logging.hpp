#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlannerCore)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerData)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerRecurrence)

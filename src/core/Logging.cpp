#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlannerCore, "planner.core")
Q_LOGGING_CATEGORY(lcPlannerData, "planner.data")
Q_LOGGING_CATEGORY(lcPlannerRecurrence, "planner.recurrence")

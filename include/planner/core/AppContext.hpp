#pragma once

#include <memory>

#include "planner/core/RecurrenceSettings.hpp"

namespace planner {
namespace data {
class DataProvider;
class OccurrenceRepository;
}

namespace core {

class CallReminderHook;
class SeriesService;

class AppContext
{
public:
    explicit AppContext(RecurrenceSettings settings);
    ~AppContext();

    const RecurrenceSettings &settings() const;
    data::OccurrenceRepository &occurrenceRepository();
    SeriesService &seriesService();

private:
    RecurrenceSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<CallReminderHook> m_reminderHook;
    std::unique_ptr<SeriesService> m_seriesService;
};

} // namespace core
} // namespace planner

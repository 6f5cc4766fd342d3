#include "planner/core/AppContext.hpp"

#include "planner/data/DataProvider.hpp"

#include "planner/core/CallReminderHook.hpp"
#include "planner/core/SeriesService.hpp"

namespace planner {
namespace core {

AppContext::AppContext(RecurrenceSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.storagePath))
    , m_reminderHook(std::make_unique<CallReminderHook>())
    , m_seriesService(std::make_unique<SeriesService>(m_dataProvider->occurrenceRepository(), m_settings,
                                                      m_reminderHook.get()))
{
}

AppContext::~AppContext() = default;

const RecurrenceSettings &AppContext::settings() const
{
    return m_settings;
}

data::OccurrenceRepository &AppContext::occurrenceRepository()
{
    return m_dataProvider->occurrenceRepository();
}

SeriesService &AppContext::seriesService()
{
    return *m_seriesService;
}

} // namespace core
} // namespace planner

#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "planner/data/Occurrence.hpp"

namespace planner {
namespace data {
class InstanceCreatedHook;
class OccurrenceRepository;
}

namespace recurrence {

class SeriesGenerator
{
public:
    static constexpr int kDefaultCount = 50;

    explicit SeriesGenerator(data::OccurrenceRepository &repository, data::InstanceCreatedHook *hook = nullptr,
                             int defaultCount = kDefaultCount);

    // Steps forward from the parent until maxCount instances exist or the next
    // anchor falls after the earliest of the rule's until date, `untilDate` and
    // the parent's series end override. Nothing is stored.
    static std::vector<data::Occurrence> generate(const data::Occurrence &parent, const data::RecurrenceRule &rule,
                                                  int maxCount,
                                                  const std::optional<QDate> &untilDate = std::nullopt);

    // Generates from the parent's own rule and stores the batch together with
    // the hook's side effects in one transaction, joining the caller's
    // transaction if one is open. Slots already held by an existing instance
    // are skipped. Returns none if the batch could not be stored.
    std::optional<std::vector<data::Occurrence>> createInstances(const data::Occurrence &parent,
                                                                 std::optional<int> maxCount = std::nullopt,
                                                                 std::optional<QDate> untilDate = std::nullopt);

private:
    data::OccurrenceRepository &m_repository;
    data::InstanceCreatedHook *m_hook = nullptr;
    int m_defaultCount = kDefaultCount;
};

} // namespace recurrence
} // namespace planner

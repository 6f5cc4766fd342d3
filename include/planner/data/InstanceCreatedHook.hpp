#pragma once

namespace planner {
namespace data {

struct Occurrence;
class OccurrenceRepository;

class InstanceCreatedHook
{
public:
    virtual ~InstanceCreatedHook() = default;

    // Runs inside the transaction that created `instance`; returning false
    // aborts that transaction.
    virtual bool onInstanceCreated(const Occurrence &instance, OccurrenceRepository &repository) = 0;
};

} // namespace data
} // namespace planner

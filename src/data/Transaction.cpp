#include "planner/data/Transaction.hpp"

#include "planner/data/OccurrenceRepository.hpp"

namespace planner {
namespace data {

Transaction::Transaction(OccurrenceRepository &repository)
    : m_repository(repository)
    , m_active(repository.beginTransaction())
{
}

Transaction::~Transaction()
{
    rollback();
}

bool Transaction::isActive() const
{
    return m_active;
}

bool Transaction::commit()
{
    if (!m_active) {
        return false;
    }
    m_active = false;
    return m_repository.commit();
}

void Transaction::rollback()
{
    if (!m_active) {
        return;
    }
    m_active = false;
    m_repository.rollback();
}

} // namespace data
} // namespace planner

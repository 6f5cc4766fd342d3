#pragma once

namespace planner {
namespace data {

class OccurrenceRepository;

// Rolls the repository back on destruction unless commit() succeeded.
class Transaction
{
public:
    explicit Transaction(OccurrenceRepository &repository);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    bool isActive() const;
    bool commit();
    void rollback();

private:
    OccurrenceRepository &m_repository;
    bool m_active = false;
};

} // namespace data
} // namespace planner

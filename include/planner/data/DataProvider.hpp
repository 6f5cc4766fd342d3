#pragma once

#include <memory>
#include <QString>

namespace planner {
namespace data {

class OccurrenceRepository;

class DataProvider
{
public:
    // An empty path selects default.ics in the application data location.
    explicit DataProvider(const QString &storagePath = QString());
    ~DataProvider();

    OccurrenceRepository &occurrenceRepository();
    const QString &filePath() const;

private:
    QString m_filePath;
    std::unique_ptr<OccurrenceRepository> m_occurrenceRepository;
};

} // namespace data
} // namespace planner

#pragma once

#include <QString>

#include "planner/data/InMemoryOccurrenceRepository.hpp"

namespace planner {
namespace data {

// InMemoryOccurrenceRepository backed by an iCalendar-style file. The whole
// file is rewritten atomically after every committed change.
class FileOccurrenceRepository : public InMemoryOccurrenceRepository
{
public:
    explicit FileOccurrenceRepository(QString filePath);
    ~FileOccurrenceRepository() override = default;

    const QString &filePath() const;

protected:
    bool persist() override;

private:
    void load();
    bool save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value, const QString &parameters);
    static QString statusToString(OccurrenceStatus status);
    static OccurrenceStatus statusFromString(const QString &value);

    QString m_filePath;
};

} // namespace data
} // namespace planner

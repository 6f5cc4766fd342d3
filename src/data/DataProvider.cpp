#include "planner/data/DataProvider.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/FileOccurrenceRepository.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace planner {
namespace data {

namespace {
QString defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/series-planner");
    }
    return QDir(storageFolder).filePath(QStringLiteral("default.ics"));
}
} // namespace

DataProvider::DataProvider(const QString &storagePath)
    : m_filePath(storagePath.isEmpty() ? defaultStoragePath() : storagePath)
{
    QDir dir = QFileInfo(m_filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerData) << "Cannot create storage folder" << dir.absolutePath();
    }
    qCDebug(lcPlannerData) << "Using storage file" << m_filePath;
    m_occurrenceRepository = std::make_unique<FileOccurrenceRepository>(m_filePath);
}

DataProvider::~DataProvider() = default;

OccurrenceRepository &DataProvider::occurrenceRepository()
{
    return *m_occurrenceRepository;
}

const QString &DataProvider::filePath() const
{
    return m_filePath;
}

} // namespace data
} // namespace planner

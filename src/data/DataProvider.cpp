#include "daytrack/data/DataProvider.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/DataDirectory.hpp"
#include "daytrack/data/FileDayRepository.hpp"
#include "daytrack/data/LegacyImporter.hpp"

namespace daytrack {
namespace data {

DataProvider::DataProvider(const QString &directoryPath)
    : m_directory(std::make_unique<DataDirectory>(directoryPath))
    , m_dayRepository(std::make_unique<FileDayRepository>(*m_directory))
{
}

DataProvider::DataProvider(std::unique_ptr<DayRepository> repository)
    : m_dayRepository(std::move(repository))
{
}

DataProvider::~DataProvider() = default;

bool DataProvider::prepare(const QDate &today, const QDateTime &now, QString *errorMessage)
{
    if (!m_directory) {
        return true;
    }
    if (!m_directory->ensureExists(errorMessage)) {
        return false;
    }
    qCInfo(lcStorage) << "using data directory" << m_directory->path();

    LegacyImporter importer(*m_directory, *m_dayRepository);
    return importer.run(today, now, errorMessage).has_value();
}

DayRepository &DataProvider::dayRepository()
{
    return *m_dayRepository;
}

const DataDirectory *DataProvider::directory() const
{
    return m_directory.get();
}

} // namespace data
} // namespace daytrack

#pragma once

#include <memory>
#include <QDateTime>
#include <QString>

namespace daytrack {
namespace data {

class DataDirectory;
class DayRepository;

class DataProvider
{
public:
    explicit DataProvider(const QString &directoryPath);
    explicit DataProvider(std::unique_ptr<DayRepository> repository);
    ~DataProvider();

    // Creates the data directory and imports any legacy files into today's record.
    bool prepare(const QDate &today, const QDateTime &now, QString *errorMessage = nullptr);

    DayRepository &dayRepository();
    const DataDirectory *directory() const;

private:
    std::unique_ptr<DataDirectory> m_directory;
    std::unique_ptr<DayRepository> m_dayRepository;
};

} // namespace data
} // namespace daytrack

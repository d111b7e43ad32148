#pragma once

#include "daytrack/data/DataDirectory.hpp"
#include "daytrack/data/DayRepository.hpp"

namespace daytrack {
namespace data {

class FileDayRepository : public DayRepository
{
public:
    explicit FileDayRepository(DataDirectory directory);
    ~FileDayRepository() override = default;

    const DataDirectory &directory() const;

    bool hasDay(const QDate &date) const override;
    std::optional<DayLists> loadDay(const QDate &date, ScheduleDay schedule,
                                    QString *errorMessage = nullptr) const override;
    bool saveDay(const QDate &date, const DayLists &lists, QString *errorMessage = nullptr) override;
    QDateTime dayLastModified(const QDate &date) const override;

    std::optional<QString> loadJournal(const QDate &date, QString *errorMessage = nullptr) const override;
    bool saveJournal(const QDate &date, const QString &text, QString *errorMessage = nullptr) override;

    std::optional<Metadata> loadMetadata(QString *errorMessage = nullptr) const override;
    bool saveMetadata(const Metadata &metadata, QString *errorMessage = nullptr) override;

private:
    DataDirectory m_directory;
};

} // namespace data
} // namespace daytrack

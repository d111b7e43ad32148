#pragma once

#include "daytrack/data/DayRepository.hpp"

#include <QByteArray>
#include <QMap>

namespace daytrack {
namespace data {

// Keeps serialized day records in memory so every save and load still goes
// through the daily file codec.
class InMemoryDayRepository : public DayRepository
{
public:
    InMemoryDayRepository();
    ~InMemoryDayRepository() override;

    bool hasDay(const QDate &date) const override;
    std::optional<DayLists> loadDay(const QDate &date, ScheduleDay schedule,
                                    QString *errorMessage = nullptr) const override;
    bool saveDay(const QDate &date, const DayLists &lists, QString *errorMessage = nullptr) override;
    QDateTime dayLastModified(const QDate &date) const override;

    std::optional<QString> loadJournal(const QDate &date, QString *errorMessage = nullptr) const override;
    bool saveJournal(const QDate &date, const QString &text, QString *errorMessage = nullptr) override;

    std::optional<Metadata> loadMetadata(QString *errorMessage = nullptr) const override;
    bool saveMetadata(const Metadata &metadata, QString *errorMessage = nullptr) override;

    void putDayContent(const QDate &date, const QString &content, const QDateTime &lastModified);
    QString dayContent(const QDate &date) const;
    void putMetadataContent(const QByteArray &json);

private:
    struct StoredDay
    {
        QString content;
        QDateTime lastModified;
    };

    QMap<QDate, StoredDay> m_days;
    QMap<QDate, QString> m_journals;
    QByteArray m_metadata;
};

} // namespace data
} // namespace daytrack

#pragma once

#include <optional>

#include "daytrack/data/DailyFileCodec.hpp"
#include "daytrack/data/MetadataStore.hpp"

namespace daytrack {
namespace data {

class DayRepository
{
public:
    virtual ~DayRepository() = default;

    virtual bool hasDay(const QDate &date) const = 0;
    // A missing day loads as empty lists; std::nullopt means the record could not be read.
    virtual std::optional<DayLists> loadDay(const QDate &date, ScheduleDay schedule,
                                            QString *errorMessage = nullptr) const = 0;
    virtual bool saveDay(const QDate &date, const DayLists &lists, QString *errorMessage = nullptr) = 0;
    virtual QDateTime dayLastModified(const QDate &date) const = 0;

    virtual std::optional<QString> loadJournal(const QDate &date, QString *errorMessage = nullptr) const = 0;
    virtual bool saveJournal(const QDate &date, const QString &text, QString *errorMessage = nullptr) = 0;

    virtual std::optional<Metadata> loadMetadata(QString *errorMessage = nullptr) const = 0;
    virtual bool saveMetadata(const Metadata &metadata, QString *errorMessage = nullptr) = 0;
};

} // namespace data
} // namespace daytrack

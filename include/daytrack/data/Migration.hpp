#pragma once

#include "daytrack/data/DayRepository.hpp"

#include <optional>

namespace daytrack {
namespace data {

class ReportGenerator;

enum class StartupSource
{
    Today,
    Yesterday,
    Fresh,
};

struct StartupState
{
    DayLists lists;
    StartupSource source = StartupSource::Fresh;
};

class Migration
{
public:
    explicit Migration(DayRepository &repository, ReportGenerator *reportGenerator = nullptr);

    std::optional<StartupState> loadForDay(const QDate &today, const QDateTime &now,
                                           QString *errorMessage = nullptr) const;

    // Force-pauses anything left running at `stoppedAt` and recomputes elapsed
    // time from history.
    static void repairActive(std::vector<Item> &items, const QDateTime &stoppedAt, const QDateTime &now);

private:
    DayRepository &m_repository;
    ReportGenerator *m_reportGenerator = nullptr;
};

} // namespace data
} // namespace daytrack

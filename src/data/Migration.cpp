#include "daytrack/data/Migration.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/ReportGenerator.hpp"

namespace daytrack {
namespace data {

Migration::Migration(DayRepository &repository, ReportGenerator *reportGenerator)
    : m_repository(repository)
    , m_reportGenerator(reportGenerator)
{
}

std::optional<StartupState> Migration::loadForDay(const QDate &today, const QDateTime &now,
                                                  QString *errorMessage) const
{
    StartupState state;

    if (m_repository.hasDay(today)) {
        std::optional<DayLists> lists = m_repository.loadDay(today, ScheduleDay::Today, errorMessage);
        if (!lists) {
            return std::nullopt;
        }
        state.lists = std::move(*lists);
        state.source = StartupSource::Today;
        repairActive(state.lists.active, m_repository.dayLastModified(today), now);
        qCInfo(lcStorage) << "loaded" << state.lists.active.size() << "active items for" << today;
        return state;
    }

    const QDate yesterday = today.addDays(-1);
    if (m_repository.hasDay(yesterday)) {
        std::optional<DayLists> lists = m_repository.loadDay(yesterday, ScheduleDay::Today, errorMessage);
        if (!lists) {
            return std::nullopt;
        }
        state.lists.active = std::move(lists->active);
        for (Item &item : state.lists.active) {
            item.schedule = ScheduleDay::Today;
        }
        state.source = StartupSource::Yesterday;
        repairActive(state.lists.active, m_repository.dayLastModified(yesterday), now);
        qCInfo(lcStorage) << "rolled" << state.lists.active.size() << "unfinished items over from" << yesterday;

        if (m_reportGenerator) {
            QString reportError;
            if (!m_reportGenerator->generate(yesterday, &reportError)) {
                qCWarning(lcStorage) << "report generation for" << yesterday << "failed:" << reportError;
            }
        }
        return state;
    }

    qCInfo(lcStorage) << "starting" << today << "with an empty day";
    return state;
}

void Migration::repairActive(std::vector<Item> &items, const QDateTime &stoppedAt, const QDateTime &now)
{
    const QDateTime closedAt = stoppedAt.isValid() ? stoppedAt : now;
    for (Item &item : items) {
        item.coerceRunningToPaused(closedAt);
        item.resyncElapsed(now);
    }
}

} // namespace data
} // namespace daytrack

#include "daytrack/data/StateHistory.hpp"

#include <algorithm>

namespace daytrack {
namespace data {

Duration StateDurations::total() const
{
    return running + paused + idle;
}

StateDurations timeInEachState(const std::vector<StateEvent> &history, const QDateTime &end)
{
    StateDurations durations;
    for (std::size_t i = 0; i < history.size(); ++i) {
        const StateEvent &event = history[i];
        const QDateTime spanEnd = i + 1 < history.size() ? history[i + 1].timestamp : end;
        if (!event.timestamp.isValid() || !spanEnd.isValid()) {
            continue;
        }
        const Duration span = std::max(Duration(0), Duration(event.timestamp.msecsTo(spanEnd)));
        switch (event.to) {
        case RunStatus::Running:
            durations.running += span;
            break;
        case RunStatus::Paused:
            durations.paused += span;
            break;
        case RunStatus::Idle:
            durations.idle += span;
            break;
        case RunStatus::Done:
        case RunStatus::Postponed:
            break;
        }
    }
    return durations;
}

StateDurations timeInEachState(const Item &item, const QDateTime &now)
{
    return timeInEachState(item.history, item.completedAt.isValid() ? item.completedAt : now);
}

Duration runningTime(const Item &item, const QDateTime &now)
{
    return timeInEachState(item, now).running;
}

int interruptionCount(const Item &item)
{
    return static_cast<int>(std::count_if(item.history.cbegin(), item.history.cend(), [](const StateEvent &event) {
        return event.from == RunStatus::Running && event.to == RunStatus::Paused;
    }));
}

int sessionCount(const Item &item)
{
    return static_cast<int>(std::count_if(item.history.cbegin(), item.history.cend(), [](const StateEvent &event) {
        return event.to == RunStatus::Running;
    }));
}

std::optional<Duration> calendarTime(const Item &item)
{
    if (!item.completedAt.isValid() || !item.createdAt.isValid()) {
        return std::nullopt;
    }
    return Duration(item.createdAt.msecsTo(item.completedAt));
}

} // namespace data
} // namespace daytrack

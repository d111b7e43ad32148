#pragma once

#include "daytrack/data/Item.hpp"

#include <optional>
#include <vector>

namespace daytrack {
namespace data {

struct StateDurations
{
    Duration running{0};
    Duration paused{0};
    Duration idle{0};

    Duration total() const;
};

// Each event's span runs until the next event, the last one until `end`.
// Spans entered by Done or Postponed events are not accumulated.
StateDurations timeInEachState(const std::vector<StateEvent> &history, const QDateTime &end);

// Ends the last span at completion time when the item is completed, otherwise at `now`.
StateDurations timeInEachState(const Item &item, const QDateTime &now);

Duration runningTime(const Item &item, const QDateTime &now);
int interruptionCount(const Item &item);
int sessionCount(const Item &item);
std::optional<Duration> calendarTime(const Item &item);

} // namespace data
} // namespace daytrack

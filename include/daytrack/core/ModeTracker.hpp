#pragma once

#include "daytrack/data/Item.hpp"
#include "daytrack/data/LifeMode.hpp"
#include "daytrack/data/MetadataStore.hpp"

#include <QUuid>

#include <array>
#include <vector>

namespace daytrack {
namespace core {

class ModeTracker
{
public:
    ModeTracker();

    // Restores mode and counters; paused-by-mode keys are resolved against `active`.
    void restore(const data::Metadata &metadata, const std::vector<data::Item> &active, const QDateTime &now);
    // Counters include the running segment up to `now`.
    data::Metadata snapshot(const std::vector<data::Item> &active, const QDateTime &now) const;

    // Leaving Working pauses and records every Running item; returning to Working
    // resumes exactly the recorded items that are still Idle or Paused. Returns
    // false when already in `mode`.
    bool switchTo(data::LifeMode mode, std::vector<data::Item> &active, const QDateTime &now);
    // Starts a new day: every counter drops to zero and the current mode counts from `now`.
    void resetCounters(const QDateTime &now);

    data::LifeMode mode() const;
    bool timersAllowed() const;
    data::Duration timeIn(data::LifeMode mode, const QDateTime &now) const;
    const std::vector<QUuid> &pausedByMode() const;

private:
    void pauseAllRunning(std::vector<data::Item> &active, const QDateTime &now);
    void resumePaused(std::vector<data::Item> &active, const QDateTime &now);

    data::LifeMode m_mode = data::LifeMode::Working;
    std::array<data::Duration, data::LifeModeCount> m_accumulated{};
    QDateTime m_segmentStart;
    std::vector<QUuid> m_pausedByMode;
};

} // namespace core
} // namespace daytrack

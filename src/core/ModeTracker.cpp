#include "daytrack/core/ModeTracker.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/ItemTree.hpp"

#include <algorithm>

namespace daytrack {
namespace core {

ModeTracker::ModeTracker()
{
    m_accumulated.fill(data::Duration(0));
}

void ModeTracker::restore(const data::Metadata &metadata, const std::vector<data::Item> &active,
                          const QDateTime &now)
{
    m_mode = metadata.mode;
    for (data::LifeMode mode : data::allLifeModes()) {
        m_accumulated[data::lifeModeIndex(mode)] =
            std::chrono::duration_cast<data::Duration>(std::chrono::seconds(metadata.secondsIn(mode)));
    }
    m_segmentStart = now;

    m_pausedByMode.clear();
    for (const QString &key : metadata.pausedByMode) {
        const std::optional<data::ItemPath> path = data::resolveDurableKey(active, key);
        const data::Item *item = path ? data::itemAt(active, *path) : nullptr;
        if (!item) {
            qCWarning(lcMode) << "mode-paused item" << key << "no longer exists";
            continue;
        }
        m_pausedByMode.push_back(item->id);
    }
}

data::Metadata ModeTracker::snapshot(const std::vector<data::Item> &active, const QDateTime &now) const
{
    data::Metadata metadata;
    metadata.mode = m_mode;
    for (data::LifeMode mode : data::allLifeModes()) {
        metadata.modeSeconds[data::lifeModeIndex(mode)] =
            std::chrono::duration_cast<std::chrono::seconds>(timeIn(mode, now)).count();
    }
    for (const QUuid &id : m_pausedByMode) {
        if (const std::optional<data::ItemPath> path = data::findById(active, id)) {
            metadata.pausedByMode << data::durableKey(active, *path);
        }
    }
    metadata.lastModeChange = now;
    return metadata;
}

bool ModeTracker::switchTo(data::LifeMode mode, std::vector<data::Item> &active, const QDateTime &now)
{
    if (mode == m_mode) {
        return false;
    }

    m_accumulated[data::lifeModeIndex(m_mode)] = timeIn(m_mode, now);
    m_segmentStart = now;

    const data::LifeMode previous = m_mode;
    m_mode = mode;
    if (!data::lifeModePausesTimers(previous) && data::lifeModePausesTimers(mode)) {
        pauseAllRunning(active, now);
    } else if (data::lifeModePausesTimers(previous) && !data::lifeModePausesTimers(mode)) {
        resumePaused(active, now);
    }
    qCInfo(lcMode) << "mode" << data::lifeModeName(previous) << "->" << data::lifeModeName(mode);
    return true;
}

void ModeTracker::resetCounters(const QDateTime &now)
{
    m_accumulated.fill(data::Duration(0));
    m_segmentStart = now;
}

data::LifeMode ModeTracker::mode() const
{
    return m_mode;
}

bool ModeTracker::timersAllowed() const
{
    return !data::lifeModePausesTimers(m_mode);
}

data::Duration ModeTracker::timeIn(data::LifeMode mode, const QDateTime &now) const
{
    data::Duration total = m_accumulated[data::lifeModeIndex(mode)];
    if (mode == m_mode && m_segmentStart.isValid()) {
        total += std::max(data::Duration(0), data::Duration(m_segmentStart.msecsTo(now)));
    }
    return total;
}

const std::vector<QUuid> &ModeTracker::pausedByMode() const
{
    return m_pausedByMode;
}

void ModeTracker::pauseAllRunning(std::vector<data::Item> &active, const QDateTime &now)
{
    m_pausedByMode.clear();
    data::forEachItem(active, [this, &now](data::Item &item) {
        if (item.status == data::RunStatus::Running) {
            m_pausedByMode.push_back(item.id);
            item.pause(now);
        }
    });
    qCDebug(lcMode) << "paused" << m_pausedByMode.size() << "items";
}

void ModeTracker::resumePaused(std::vector<data::Item> &active, const QDateTime &now)
{
    for (const QUuid &id : m_pausedByMode) {
        const std::optional<data::ItemPath> path = data::findById(active, id);
        data::Item *item = path ? data::itemAt(active, *path) : nullptr;
        // Shutdown leaves recorded items Idle.
        if (!item || (item->status != data::RunStatus::Paused && item->status != data::RunStatus::Idle)) {
            continue;
        }
        item->start(now);
        if (path->isSubtask()) {
            data::syncParentStatus(active[static_cast<std::size_t>(path->index)], now);
        }
    }
    qCDebug(lcMode) << "resumed" << m_pausedByMode.size() << "items";
    m_pausedByMode.clear();
}

} // namespace core
} // namespace daytrack

#include "daytrack/data/Item.hpp"

#include "daytrack/data/StateHistory.hpp"

#include <algorithm>

namespace daytrack {
namespace data {

namespace {
Duration spanBetween(const QDateTime &from, const QDateTime &to)
{
    if (!from.isValid() || !to.isValid()) {
        return Duration(0);
    }
    return std::max(Duration(0), Duration(from.msecsTo(to)));
}
} // namespace

QString statusTag(RunStatus status)
{
    switch (status) {
    case RunStatus::Idle:
        return QStringLiteral("IDLE");
    case RunStatus::Running:
        return QStringLiteral("RUNNING");
    case RunStatus::Paused:
        return QStringLiteral("PAUSED");
    case RunStatus::Done:
        return QStringLiteral("DONE");
    case RunStatus::Postponed:
        return QStringLiteral("POSTPONED");
    }
    return QStringLiteral("IDLE");
}

std::optional<RunStatus> statusFromTag(const QString &tag)
{
    const QString upper = tag.trimmed().toUpper();
    if (upper == QLatin1String("IDLE")) {
        return RunStatus::Idle;
    }
    if (upper == QLatin1String("RUNNING")) {
        return RunStatus::Running;
    }
    if (upper == QLatin1String("PAUSED")) {
        return RunStatus::Paused;
    }
    if (upper == QLatin1String("DONE")) {
        return RunStatus::Done;
    }
    if (upper == QLatin1String("POSTPONED")) {
        return RunStatus::Postponed;
    }
    return std::nullopt;
}

bool isActiveStatus(RunStatus status)
{
    return status == RunStatus::Idle || status == RunStatus::Running || status == RunStatus::Paused;
}

bool TimeTracking::isRunning() const
{
    return runningSince.isValid();
}

void TimeTracking::start(const QDateTime &now)
{
    runningSince = now;
}

void TimeTracking::pause(const QDateTime &now)
{
    if (!runningSince.isValid()) {
        return;
    }
    elapsed += spanBetween(runningSince, now);
    runningSince = QDateTime();
}

void TimeTracking::tick(const QDateTime &now)
{
    if (!runningSince.isValid()) {
        return;
    }
    elapsed += spanBetween(runningSince, now);
    runningSince = now;
}

void TimeTracking::increaseEstimate(Duration amount)
{
    estimate += amount;
}

void TimeTracking::decreaseEstimate(Duration amount)
{
    estimate = std::max(Duration(0), estimate - amount);
}

double TimeTracking::progressRatio() const
{
    if (estimate.count() == 0) {
        return 1.0;
    }
    return static_cast<double>(elapsed.count()) / static_cast<double>(estimate.count());
}

Item Item::create(const QString &title, Duration estimate, const QDateTime &now, ScheduleDay schedule)
{
    Item item;
    item.title = title.trimmed();
    item.schedule = schedule;
    item.tracking.estimate = estimate;
    item.createdAt = now;
    item.history.push_back(StateEvent{now, std::nullopt, RunStatus::Idle});
    return item;
}

void Item::appendEvent(const QDateTime &now, RunStatus to)
{
    const RunStatus previous = status;
    status = to;
    history.push_back(StateEvent{now, previous, to});
}

void Item::start(const QDateTime &now)
{
    if (status != RunStatus::Idle && status != RunStatus::Paused) {
        return;
    }
    tracking.start(now);
    appendEvent(now, RunStatus::Running);
}

void Item::pause(const QDateTime &now)
{
    if (status != RunStatus::Running) {
        return;
    }
    tracking.pause(now);
    appendEvent(now, RunStatus::Paused);
}

void Item::setIdle(const QDateTime &now)
{
    if (status != RunStatus::Running && status != RunStatus::Paused) {
        return;
    }
    tracking.pause(now);
    appendEvent(now, RunStatus::Idle);
}

void Item::toggleRunPause(const QDateTime &now)
{
    switch (status) {
    case RunStatus::Idle:
    case RunStatus::Paused:
        start(now);
        break;
    case RunStatus::Running:
        pause(now);
        break;
    case RunStatus::Done:
    case RunStatus::Postponed:
        break;
    }
}

void Item::markDone(const QDateTime &now)
{
    if (status == RunStatus::Done) {
        return;
    }
    tracking.pause(now);
    completedAt = now;
    appendEvent(now, RunStatus::Done);
}

void Item::postpone(const QDateTime &now)
{
    tracking.pause(now);
    if (status != RunStatus::Idle) {
        appendEvent(now, RunStatus::Idle);
    }
}

void Item::tick(const QDateTime &now)
{
    if (status == RunStatus::Running) {
        tracking.tick(now);
    }
    for (Item &subtask : subtasks) {
        subtask.tick(now);
    }
}

void Item::increaseEstimate(Duration amount)
{
    tracking.increaseEstimate(amount);
}

void Item::decreaseEstimate(Duration amount)
{
    tracking.decreaseEstimate(amount);
}

bool Item::isOverEstimate() const
{
    return status == RunStatus::Running && tracking.elapsed >= tracking.estimate;
}

void Item::setNotes(const QString &text)
{
    int length = text.size();
    while (length > 0 && text.at(length - 1).isSpace()) {
        --length;
    }
    notes = text.left(length);
}

bool Item::addTag(const QString &tag)
{
    const QString cleaned = tag.trimmed();
    if (cleaned.isEmpty() || cleaned.contains(QLatin1Char(',')) || tags.contains(cleaned)) {
        return false;
    }
    tags << cleaned;
    return true;
}

bool Item::removeTag(const QString &tag)
{
    return tags.removeAll(tag.trimmed()) > 0;
}

void Item::setTags(const QStringList &newTags)
{
    tags.clear();
    for (const QString &tag : newTags) {
        addTag(tag);
    }
}

bool Item::hasSubtasks() const
{
    return !subtasks.empty();
}

bool Item::hasRunningSubtask() const
{
    return std::any_of(subtasks.cbegin(), subtasks.cend(), [](const Item &subtask) {
        return subtask.status == RunStatus::Running;
    });
}

bool Item::addSubtask(Item subtask)
{
    if (subtask.hasSubtasks()) {
        return false;
    }
    subtasks.push_back(std::move(subtask));
    return true;
}

void Item::coerceRunningToPaused(const QDateTime &at)
{
    tracking.runningSince = QDateTime();
    const bool openSpan = !history.empty() && history.back().to == RunStatus::Running;
    if (status == RunStatus::Running || openSpan) {
        const RunStatus closedTo = status == RunStatus::Running ? RunStatus::Paused : status;
        if (history.empty()) {
            status = closedTo;
        } else {
            QDateTime closedAt = history.back().timestamp;
            if (at.isValid() && at > closedAt) {
                closedAt = at;
            }
            history.push_back(StateEvent{closedAt, RunStatus::Running, closedTo});
            status = closedTo;
        }
    }
    for (Item &subtask : subtasks) {
        subtask.coerceRunningToPaused(at);
    }
}

void Item::resyncElapsed(const QDateTime &now)
{
    if (!history.empty()) {
        tracking.elapsed = timeInEachState(*this, now).running;
    }
    for (Item &subtask : subtasks) {
        subtask.resyncElapsed(now);
    }
}

QString formatDuration(Duration duration)
{
    const qint64 totalMinutes = std::chrono::duration_cast<std::chrono::minutes>(duration).count();
    const qint64 hours = totalMinutes / 60;
    const qint64 minutes = totalMinutes % 60;
    if (hours > 0 && minutes > 0) {
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    }
    if (hours > 0) {
        return QStringLiteral("%1h").arg(hours);
    }
    return QStringLiteral("%1m").arg(minutes);
}

} // namespace data
} // namespace daytrack

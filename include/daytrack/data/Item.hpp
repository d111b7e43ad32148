#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>

#include <chrono>
#include <optional>
#include <vector>

namespace daytrack {
namespace data {

using Duration = std::chrono::milliseconds;

enum class RunStatus
{
    Idle,
    Running,
    Paused,
    Done,
    Postponed,
};

enum class ScheduleDay
{
    Today,
    Tomorrow,
};

QString statusTag(RunStatus status);
std::optional<RunStatus> statusFromTag(const QString &tag);
bool isActiveStatus(RunStatus status);

struct StateEvent
{
    QDateTime timestamp;
    std::optional<RunStatus> from;
    RunStatus to = RunStatus::Idle;
};

struct TimeTracking
{
    Duration estimate{0};
    Duration elapsed{0};
    // Invalid while the timer is stopped.
    QDateTime runningSince;

    bool isRunning() const;
    void start(const QDateTime &now);
    void pause(const QDateTime &now);
    void tick(const QDateTime &now);
    void increaseEstimate(Duration amount);
    void decreaseEstimate(Duration amount);
    double progressRatio() const;
};

struct Item
{
    QUuid id = QUuid::createUuid();
    QString title;
    QString notes;
    QStringList tags;
    ScheduleDay schedule = ScheduleDay::Today;
    RunStatus status = RunStatus::Idle;
    TimeTracking tracking;
    QDateTime createdAt;
    QDateTime completedAt;
    std::vector<StateEvent> history;
    std::vector<Item> subtasks;
    bool expanded = true;

    static Item create(const QString &title, Duration estimate, const QDateTime &now,
                       ScheduleDay schedule = ScheduleDay::Today);

    void start(const QDateTime &now);
    void pause(const QDateTime &now);
    void setIdle(const QDateTime &now);
    void toggleRunPause(const QDateTime &now);
    void markDone(const QDateTime &now);
    void postpone(const QDateTime &now);
    void tick(const QDateTime &now);

    void increaseEstimate(Duration amount);
    void decreaseEstimate(Duration amount);
    bool isOverEstimate() const;

    // Trailing whitespace and blank lines are dropped; they do not survive the daily file.
    void setNotes(const QString &text);

    // Tags are stored comma separated, so a tag containing a comma is rejected.
    bool addTag(const QString &tag);
    bool removeTag(const QString &tag);
    void setTags(const QStringList &newTags);

    bool hasSubtasks() const;
    bool hasRunningSubtask() const;
    bool addSubtask(Item subtask);

    // Load-time repair. A Running item becomes Paused and a history left ending in
    // Running is closed at `at`, never earlier than its last event.
    void coerceRunningToPaused(const QDateTime &at);
    void resyncElapsed(const QDateTime &now);

private:
    void appendEvent(const QDateTime &now, RunStatus to);
};

QString formatDuration(Duration duration);

} // namespace data
} // namespace daytrack

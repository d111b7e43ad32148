#include "daytrack/core/Tracker.hpp"

#include "daytrack/core/Clock.hpp"
#include "daytrack/core/ItemCommands.hpp"
#include "daytrack/core/Logging.hpp"
#include "daytrack/core/Notifier.hpp"
#include "daytrack/core/UndoStack.hpp"
#include "daytrack/data/DayRepository.hpp"
#include "daytrack/data/Migration.hpp"

#include <algorithm>
#include <memory>

namespace daytrack {
namespace core {

namespace {
data::Duration minutes(int count)
{
    return std::chrono::duration_cast<data::Duration>(std::chrono::minutes(count));
}
} // namespace

Tracker::Tracker(data::DayRepository &repository, UndoStack &undoStack, const Clock &clock, Notifier &notifier,
                 const Settings &settings)
    : m_repository(repository)
    , m_undoStack(undoStack)
    , m_clock(clock)
    , m_notifier(notifier)
    , m_settings(settings)
{
    m_undoStack.setLimit(static_cast<std::size_t>(m_settings.undoLimit));
}

Tracker::~Tracker() = default;

void Tracker::setReportGenerator(data::ReportGenerator *generator)
{
    m_reportGenerator = generator;
}

bool Tracker::load(const QDate &day, QString *errorMessage)
{
    const QDateTime now = m_clock.now();
    const data::Migration migration(m_repository, m_reportGenerator);
    std::optional<data::StartupState> state = migration.loadForDay(day, now, errorMessage);
    if (!state) {
        return false;
    }
    std::optional<data::Metadata> metadata = m_repository.loadMetadata(errorMessage);
    if (!metadata) {
        return false;
    }
    if (data::MetadataStore::resetIfStale(*metadata, day)) {
        qCInfo(lcMode) << "mode counters start from zero for" << day;
    }

    m_day = day;
    m_lists = std::move(state->lists);
    m_modeTracker.restore(*metadata, m_lists.active, now);
    m_undoStack.clear();
    m_selection.reset();
    normalizeSelection();

    m_estimateNotified.clear();
    m_idleDeadline = QDateTime();
    m_lastConfirmation = now;
    m_lastSave = now;
    m_saveFailing = false;
    m_dirty = state->source != data::StartupSource::Today;
    return true;
}

bool Tracker::save(QString *errorMessage)
{
    const QDateTime now = m_clock.now();
    if (!m_repository.saveDay(m_day, m_lists, errorMessage)) {
        return false;
    }
    if (!m_repository.saveMetadata(m_modeTracker.snapshot(m_lists.active, now), errorMessage)) {
        return false;
    }
    m_dirty = false;
    m_lastSave = now;
    if (m_saveFailing) {
        qCInfo(lcTracker) << "saving succeeded again";
        m_saveFailing = false;
    }
    return true;
}

bool Tracker::rollOver(const QDate &newDay, QString *errorMessage)
{
    const QDateTime now = m_clock.now();
    pauseAllRunning(now);
    if (!save(errorMessage)) {
        m_dirty = true;
        return false;
    }
    m_modeTracker.resetCounters(now);
    if (!m_repository.saveMetadata(m_modeTracker.snapshot(m_lists.active, now), errorMessage)) {
        m_dirty = true;
        return false;
    }
    qCInfo(lcTracker) << "day changed from" << m_day << "to" << newDay;
    return load(newDay, errorMessage);
}

bool Tracker::hasDayChanged() const
{
    return m_day.isValid() && m_clock.now().date() != m_day;
}

const QDate &Tracker::day() const
{
    return m_day;
}

const data::DayLists &Tracker::lists() const
{
    return m_lists;
}

const std::vector<data::Item> &Tracker::activeItems() const
{
    return m_lists.active;
}

const std::vector<data::Item> &Tracker::doneItems() const
{
    return m_lists.done;
}

const std::vector<data::Item> &Tracker::archivedItems() const
{
    return m_lists.archived;
}

std::vector<data::ItemRow> Tracker::rows() const
{
    return data::flattenItems(m_lists.active);
}

std::optional<data::ItemPath> Tracker::selection() const
{
    return m_selection;
}

const data::Item *Tracker::selectedItem() const
{
    return m_selection ? data::itemAt(m_lists.active, *m_selection) : nullptr;
}

bool Tracker::select(const data::ItemPath &path)
{
    if (!data::itemAt(m_lists.active, path)) {
        return false;
    }
    m_selection = path;
    return true;
}

void Tracker::moveSelection(int delta)
{
    const std::vector<data::ItemRow> rows = data::flattenItems(m_lists.active);
    if (rows.empty()) {
        m_selection.reset();
        return;
    }
    int current = 0;
    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        if (m_selection && rows[static_cast<std::size_t>(i)].path == *m_selection) {
            current = i;
            break;
        }
    }
    const int target = qBound(0, current + delta, static_cast<int>(rows.size()) - 1);
    m_selection = rows[static_cast<std::size_t>(target)].path;
}

bool Tracker::toggleExpanded()
{
    if (!m_selection) {
        return false;
    }
    data::Item &task = m_lists.active[static_cast<std::size_t>(m_selection->index)];
    if (!task.hasSubtasks()) {
        return false;
    }
    task.expanded = !task.expanded;
    if (!task.expanded) {
        m_selection = data::ItemPath{m_selection->index, std::nullopt};
    }
    return true;
}

std::optional<QUuid> Tracker::addTask(const QString &title, const QString &notes, const QStringList &tags)
{
    if (title.trimmed().isEmpty()) {
        return std::nullopt;
    }
    data::Item item = data::Item::create(title, minutes(m_settings.defaultEstimateMinutes), m_clock.now());
    item.setNotes(notes);
    item.setTags(tags);
    const QUuid id = item.id;
    m_lists.active.push_back(std::move(item));
    m_selection = data::ItemPath{static_cast<int>(m_lists.active.size()) - 1, std::nullopt};
    markDirty();
    return id;
}

std::optional<QUuid> Tracker::addSubtask(const QString &title, const QString &notes, const QStringList &tags)
{
    if (!m_selection || title.trimmed().isEmpty()) {
        return std::nullopt;
    }
    data::Item &parent = m_lists.active[static_cast<std::size_t>(m_selection->index)];
    data::Item subtask = data::Item::create(title, minutes(m_settings.defaultEstimateMinutes), m_clock.now());
    subtask.setNotes(notes);
    subtask.setTags(tags);
    const QUuid id = subtask.id;
    if (!parent.addSubtask(std::move(subtask))) {
        return std::nullopt;
    }
    parent.expanded = true;
    m_selection = data::ItemPath{m_selection->index, static_cast<int>(parent.subtasks.size()) - 1};
    markDirty();
    return id;
}

bool Tracker::renameSelected(const QString &title)
{
    data::Item *item = mutableSelected();
    if (!item || title.trimmed().isEmpty()) {
        return false;
    }
    item->title = title.trimmed();
    markDirty();
    return true;
}

bool Tracker::setSelectedNotes(const QString &notes)
{
    data::Item *item = mutableSelected();
    if (!item) {
        return false;
    }
    item->setNotes(notes);
    markDirty();
    return true;
}

bool Tracker::setSelectedTags(const QStringList &tags)
{
    data::Item *item = mutableSelected();
    if (!item) {
        return false;
    }
    item->setTags(tags);
    markDirty();
    return true;
}

bool Tracker::moveSelectedUp()
{
    return moveSelected(-1);
}

bool Tracker::moveSelectedDown()
{
    return moveSelected(1);
}

bool Tracker::toggleSelected()
{
    data::Item *item = mutableSelected();
    if (!item) {
        return false;
    }
    if (!m_modeTracker.timersAllowed() && item->status != data::RunStatus::Running) {
        qCDebug(lcTracker) << "not starting" << item->title << "outside of Working mode";
        return false;
    }

    const QDateTime now = m_clock.now();
    const data::RunStatus before = item->status;
    item->toggleRunPause(now);
    if (item->status == before) {
        return false;
    }
    if (m_selection->isSubtask()) {
        data::syncParentStatus(m_lists.active[static_cast<std::size_t>(m_selection->index)], now);
    }
    confirmActivity();
    markDirty();
    return true;
}

bool Tracker::increaseSelectedEstimate()
{
    data::Item *item = mutableSelected();
    if (!item) {
        return false;
    }
    item->increaseEstimate(minutes(m_settings.estimateStepMinutes));
    m_estimateNotified.remove(item->id);
    markDirty();
    return true;
}

bool Tracker::decreaseSelectedEstimate()
{
    data::Item *item = mutableSelected();
    if (!item) {
        return false;
    }
    item->decreaseEstimate(minutes(m_settings.estimateStepMinutes));
    m_estimateNotified.remove(item->id);
    markDirty();
    return true;
}

bool Tracker::markSelectedDone()
{
    return pushMove(MoveKind::MarkDone);
}

bool Tracker::archiveSelected()
{
    return pushMove(MoveKind::Archive);
}

bool Tracker::deleteSelected()
{
    const data::Item *item = selectedItem();
    if (!item) {
        return false;
    }
    if (!m_selection->isSubtask() && item->hasSubtasks()) {
        qCDebug(lcTracker) << "refusing to delete" << item->title << "while it has subtasks";
        return false;
    }
    return pushMove(MoveKind::Delete);
}

bool Tracker::postponeSelected(QString *errorMessage)
{
    const data::Item *selected = selectedItem();
    if (!selected) {
        return false;
    }

    const QDateTime now = m_clock.now();
    const QDate tomorrow = m_day.addDays(1);
    data::Item postponed = *selected;
    for (data::Item &subtask : postponed.subtasks) {
        subtask.pause(now);
    }
    postponed.postpone(now);
    postponed.schedule = data::ScheduleDay::Tomorrow;

    std::optional<data::DayLists> tomorrowLists =
        m_repository.loadDay(tomorrow, data::ScheduleDay::Tomorrow, errorMessage);
    if (!tomorrowLists) {
        qCWarning(lcTracker) << "cannot postpone" << postponed.title << "to" << tomorrow;
        return false;
    }
    tomorrowLists->active.push_back(postponed);
    if (!m_repository.saveDay(tomorrow, *tomorrowLists, errorMessage)) {
        qCWarning(lcTracker) << "cannot postpone" << postponed.title << "to" << tomorrow;
        return false;
    }

    const data::ItemPath path = *m_selection;
    data::Item &owner = m_lists.active[static_cast<std::size_t>(path.index)];
    if (path.isSubtask()) {
        owner.subtasks.erase(owner.subtasks.begin() + *path.subIndex);
        data::syncParentStatus(owner, now);
    } else {
        m_lists.active.erase(m_lists.active.begin() + path.index);
    }
    m_estimateNotified.remove(postponed.id);
    normalizeSelection();
    markDirty();
    qCInfo(lcTracker) << "postponed" << postponed.title << "to" << tomorrow;
    return true;
}

bool Tracker::undo()
{
    if (!m_undoStack.undo()) {
        return false;
    }
    normalizeSelection();
    markDirty();
    return true;
}

bool Tracker::redo()
{
    if (!m_undoStack.redo()) {
        return false;
    }
    normalizeSelection();
    markDirty();
    return true;
}

bool Tracker::setMode(data::LifeMode mode)
{
    if (!m_modeTracker.switchTo(mode, m_lists.active, m_clock.now())) {
        return false;
    }
    if (!m_modeTracker.timersAllowed()) {
        m_idleDeadline = QDateTime();
    }
    markDirty();
    return true;
}

const ModeTracker &Tracker::modeTracker() const
{
    return m_modeTracker;
}

void Tracker::tick()
{
    const QDateTime now = m_clock.now();
    for (data::Item &item : m_lists.active) {
        item.tick(now);
    }
    checkEstimates();
    checkIdle(now);
    autosave(now);
}

void Tracker::confirmActivity()
{
    m_lastConfirmation = m_clock.now();
    m_idleDeadline = QDateTime();
}

bool Tracker::idleCheckPending() const
{
    return m_idleDeadline.isValid();
}

void Tracker::idleAll()
{
    const QDateTime now = m_clock.now();
    data::forEachItem(m_lists.active, [&now](data::Item &item) {
        item.setIdle(now);
    });
    markDirty();
}

ActivityState Tracker::activityState() const
{
    bool anyPaused = false;
    for (const data::Item &item : m_lists.active) {
        if (item.status == data::RunStatus::Running || item.hasRunningSubtask()) {
            return ActivityState::Running;
        }
        anyPaused = anyPaused || item.status == data::RunStatus::Paused
                    || std::any_of(item.subtasks.cbegin(), item.subtasks.cend(), [](const data::Item &subtask) {
                           return subtask.status == data::RunStatus::Paused;
                       });
    }
    return anyPaused ? ActivityState::Paused : ActivityState::Idle;
}

data::Totals Tracker::totals() const
{
    return data::computeTotals(m_lists.active);
}

bool Tracker::isDirty() const
{
    return m_dirty;
}

data::Item *Tracker::mutableSelected()
{
    return m_selection ? data::itemAt(m_lists.active, *m_selection) : nullptr;
}

void Tracker::normalizeSelection()
{
    const std::vector<data::ItemRow> rows = data::flattenItems(m_lists.active);
    if (rows.empty()) {
        m_selection.reset();
        return;
    }
    if (!m_selection) {
        m_selection = rows.front().path;
        return;
    }

    std::optional<data::ItemPath> sameTask;
    for (const data::ItemRow &row : rows) {
        if (row.path == *m_selection) {
            return;
        }
        if (row.path.index == m_selection->index) {
            sameTask = row.path;
        }
    }
    m_selection = sameTask ? *sameTask : rows.back().path;
}

bool Tracker::moveSelected(int delta)
{
    if (!m_selection) {
        return false;
    }
    const data::ItemPath path = *m_selection;
    if (path.isSubtask()) {
        auto &subtasks = m_lists.active[static_cast<std::size_t>(path.index)].subtasks;
        const int target = *path.subIndex + delta;
        if (target < 0 || target >= static_cast<int>(subtasks.size())) {
            return false;
        }
        std::swap(subtasks[static_cast<std::size_t>(*path.subIndex)], subtasks[static_cast<std::size_t>(target)]);
        m_selection = data::ItemPath{path.index, target};
    } else {
        const int target = path.index + delta;
        if (target < 0 || target >= static_cast<int>(m_lists.active.size())) {
            return false;
        }
        std::swap(m_lists.active[static_cast<std::size_t>(path.index)], m_lists.active[static_cast<std::size_t>(target)]);
        m_selection = data::ItemPath{target, std::nullopt};
    }
    markDirty();
    return true;
}

bool Tracker::pushMove(MoveKind kind)
{
    const data::Item *item = selectedItem();
    if (!item) {
        return false;
    }
    const QUuid id = item->id;
    Notifier *notifier = kind == MoveKind::MarkDone ? &m_notifier : nullptr;
    m_undoStack.push(std::make_unique<MoveItemCommand>(m_lists, id, kind, m_clock, notifier));
    m_estimateNotified.remove(id);
    normalizeSelection();
    markDirty();
    return true;
}

void Tracker::pauseAllRunning(const QDateTime &now)
{
    data::forEachItem(m_lists.active, [&now](data::Item &item) {
        item.pause(now);
    });
}

bool Tracker::anyRunning() const
{
    return activityState() == ActivityState::Running;
}

void Tracker::checkEstimates()
{
    data::forEachItem(m_lists.active, [this](data::Item &item) {
        if (item.isOverEstimate() && !m_estimateNotified.contains(item.id)) {
            m_estimateNotified.insert(item.id);
            m_notifier.notify(NotificationKind::EstimateReached, item.title);
        }
    });
}

void Tracker::checkIdle(const QDateTime &now)
{
    if (!anyRunning()) {
        m_lastConfirmation = now;
        m_idleDeadline = QDateTime();
        return;
    }
    if (m_idleDeadline.isValid()) {
        if (now >= m_idleDeadline) {
            pauseAllRunning(now);
            m_idleDeadline = QDateTime();
            m_lastConfirmation = now;
            qCInfo(lcTracker) << "no activity confirmed, paused all running items";
            m_notifier.notify(NotificationKind::AutoPaused, QStringLiteral("All running items were paused"));
            markDirty();
        }
        return;
    }
    if (m_lastConfirmation.secsTo(now) >= static_cast<qint64>(m_settings.idleCheckMinutes) * 60) {
        m_idleDeadline = now.addSecs(static_cast<qint64>(m_settings.idleGraceMinutes) * 60);
        m_notifier.notify(NotificationKind::IdleCheck, QStringLiteral("Still working?"));
    }
}

void Tracker::autosave(const QDateTime &now)
{
    const bool checkpointDue = anyRunning() && m_lastSave.secsTo(now) >= m_settings.checkpointSeconds;
    if (!m_dirty && !checkpointDue) {
        return;
    }
    QString error;
    if (save(&error)) {
        return;
    }
    m_dirty = true;
    if (!m_saveFailing) {
        m_saveFailing = true;
        qCWarning(lcTracker) << "autosave failed, retrying on the next tick:" << error;
        m_notifier.notify(NotificationKind::SaveFailed, error);
    }
}

void Tracker::markDirty()
{
    m_dirty = true;
}

} // namespace core
} // namespace daytrack

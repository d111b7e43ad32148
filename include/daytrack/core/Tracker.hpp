#pragma once

#include "daytrack/core/ModeTracker.hpp"
#include "daytrack/core/Settings.hpp"
#include "daytrack/data/DailyFileCodec.hpp"
#include "daytrack/data/ItemTree.hpp"

#include <QSet>
#include <QUuid>

#include <optional>

namespace daytrack {
namespace data {
class DayRepository;
class ReportGenerator;
}

namespace core {

class Clock;
class Notifier;
class UndoStack;
enum class MoveKind;

enum class ActivityState
{
    Running,
    Paused,
    Idle,
};

// The single in-memory owner of one day's items. Every structural change goes
// through here so selection, parent status and the dirty flag stay consistent.
class Tracker
{
public:
    Tracker(data::DayRepository &repository, UndoStack &undoStack, const Clock &clock, Notifier &notifier,
            const Settings &settings);
    ~Tracker();

    void setReportGenerator(data::ReportGenerator *generator);

    bool load(const QDate &day, QString *errorMessage = nullptr);
    bool save(QString *errorMessage = nullptr);
    bool rollOver(const QDate &newDay, QString *errorMessage = nullptr);
    bool hasDayChanged() const;

    const QDate &day() const;
    const data::DayLists &lists() const;
    const std::vector<data::Item> &activeItems() const;
    const std::vector<data::Item> &doneItems() const;
    const std::vector<data::Item> &archivedItems() const;
    std::vector<data::ItemRow> rows() const;

    std::optional<data::ItemPath> selection() const;
    const data::Item *selectedItem() const;
    bool select(const data::ItemPath &path);
    void moveSelection(int delta);
    bool toggleExpanded();

    std::optional<QUuid> addTask(const QString &title, const QString &notes = QString(),
                                 const QStringList &tags = QStringList());
    std::optional<QUuid> addSubtask(const QString &title, const QString &notes = QString(),
                                    const QStringList &tags = QStringList());
    bool renameSelected(const QString &title);
    bool setSelectedNotes(const QString &notes);
    bool setSelectedTags(const QStringList &tags);
    bool moveSelectedUp();
    bool moveSelectedDown();

    bool toggleSelected();
    bool increaseSelectedEstimate();
    bool decreaseSelectedEstimate();

    bool markSelectedDone();
    bool archiveSelected();
    bool deleteSelected();
    bool postponeSelected(QString *errorMessage = nullptr);
    bool undo();
    bool redo();

    bool setMode(data::LifeMode mode);
    const ModeTracker &modeTracker() const;

    void tick();
    void confirmActivity();
    bool idleCheckPending() const;
    void idleAll();

    ActivityState activityState() const;
    data::Totals totals() const;
    bool isDirty() const;

private:
    data::Item *mutableSelected();
    void normalizeSelection();
    bool moveSelected(int delta);
    bool pushMove(MoveKind kind);
    void pauseAllRunning(const QDateTime &now);
    bool anyRunning() const;
    void checkEstimates();
    void checkIdle(const QDateTime &now);
    void autosave(const QDateTime &now);
    void markDirty();

    data::DayRepository &m_repository;
    UndoStack &m_undoStack;
    const Clock &m_clock;
    Notifier &m_notifier;
    Settings m_settings;
    data::ReportGenerator *m_reportGenerator = nullptr;

    QDate m_day;
    data::DayLists m_lists;
    std::optional<data::ItemPath> m_selection;
    ModeTracker m_modeTracker;

    bool m_dirty = false;
    bool m_saveFailing = false;
    QDateTime m_lastSave;
    QDateTime m_lastConfirmation;
    QDateTime m_idleDeadline;
    QSet<QUuid> m_estimateNotified;
};

} // namespace core
} // namespace daytrack

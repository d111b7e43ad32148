#pragma once

#include "daytrack/core/UndoCommand.hpp"
#include "daytrack/data/DailyFileCodec.hpp"

#include <QUuid>

#include <optional>

namespace daytrack {
namespace core {

class Clock;
class Notifier;

enum class MoveKind
{
    MarkDone,
    Archive,
    Delete,
};

// Moves an active item (or subtask) to the done or archived list, or drops it.
// Undo puts the snapshot taken before the move back as close to its origin as
// the current lists allow: a subtask whose parent is gone returns as a task.
class MoveItemCommand : public UndoCommand
{
public:
    MoveItemCommand(data::DayLists &lists, const QUuid &itemId, MoveKind kind, const Clock &clock,
                    Notifier *notifier = nullptr);

    void redo() override;
    void undo() override;
    QString text() const override;

    bool applied() const;

private:
    std::vector<data::Item> *destination();

    data::DayLists &m_lists;
    QUuid m_itemId;
    MoveKind m_kind;
    const Clock &m_clock;
    Notifier *m_notifier = nullptr;

    std::optional<data::Item> m_snapshot;
    int m_index = 0;
    std::optional<int> m_subIndex;
    QUuid m_parentId;
    bool m_applied = false;
};

} // namespace core
} // namespace daytrack

#include "daytrack/core/ItemCommands.hpp"

#include "daytrack/core/Clock.hpp"
#include "daytrack/core/Notifier.hpp"
#include "daytrack/data/ItemTree.hpp"

#include <algorithm>

namespace daytrack {
namespace core {

namespace {
void pauseRunningSubtasks(data::Item &item, const QDateTime &now)
{
    for (data::Item &subtask : item.subtasks) {
        subtask.pause(now);
    }
}

bool removeById(std::vector<data::Item> &items, const QUuid &id)
{
    const auto it = std::find_if(items.begin(), items.end(), [&id](const data::Item &item) {
        return item.id == id;
    });
    if (it == items.end()) {
        return false;
    }
    items.erase(it);
    return true;
}
} // namespace

MoveItemCommand::MoveItemCommand(data::DayLists &lists, const QUuid &itemId, MoveKind kind, const Clock &clock,
                                 Notifier *notifier)
    : m_lists(lists)
    , m_itemId(itemId)
    , m_kind(kind)
    , m_clock(clock)
    , m_notifier(notifier)
{
}

void MoveItemCommand::redo()
{
    m_applied = false;
    const std::optional<data::ItemPath> path = data::findById(m_lists.active, m_itemId);
    if (!path) {
        return;
    }

    const QDateTime now = m_clock.now();
    m_index = path->index;
    m_subIndex = path->subIndex;
    data::Item &owner = m_lists.active[static_cast<std::size_t>(path->index)];

    data::Item moved;
    if (path->subIndex) {
        m_parentId = owner.id;
        const auto position = owner.subtasks.begin() + *path->subIndex;
        m_snapshot = *position;
        moved = std::move(*position);
        owner.subtasks.erase(position);
        data::syncParentStatus(owner, now);
    } else {
        m_parentId = QUuid();
        m_snapshot = owner;
        moved = std::move(owner);
        m_lists.active.erase(m_lists.active.begin() + path->index);
    }

    switch (m_kind) {
    case MoveKind::MarkDone:
        pauseRunningSubtasks(moved, now);
        moved.markDone(now);
        if (m_notifier) {
            m_notifier->notify(NotificationKind::TaskDone, moved.title);
        }
        m_lists.done.push_back(std::move(moved));
        break;
    case MoveKind::Archive:
        pauseRunningSubtasks(moved, now);
        moved.pause(now);
        m_lists.archived.push_back(std::move(moved));
        break;
    case MoveKind::Delete:
        break;
    }
    m_applied = true;
}

void MoveItemCommand::undo()
{
    if (!m_applied || !m_snapshot) {
        return;
    }
    if (std::vector<data::Item> *list = destination()) {
        removeById(*list, m_itemId);
    }

    data::Item restored = *m_snapshot;
    auto &active = m_lists.active;
    if (m_subIndex) {
        const auto parent = std::find_if(active.begin(), active.end(), [this](const data::Item &item) {
            return item.id == m_parentId;
        });
        if (parent != active.end()) {
            const int position = std::min(*m_subIndex, static_cast<int>(parent->subtasks.size()));
            parent->subtasks.insert(parent->subtasks.begin() + position, std::move(restored));
            data::syncParentStatus(*parent, m_clock.now());
            m_applied = false;
            return;
        }
    }
    const int position = std::min(m_index, static_cast<int>(active.size()));
    active.insert(active.begin() + position, std::move(restored));
    m_applied = false;
}

QString MoveItemCommand::text() const
{
    const QString title = m_snapshot ? m_snapshot->title : QString();
    switch (m_kind) {
    case MoveKind::MarkDone:
        return QStringLiteral("mark \"%1\" done").arg(title);
    case MoveKind::Archive:
        return QStringLiteral("archive \"%1\"").arg(title);
    case MoveKind::Delete:
        return QStringLiteral("delete \"%1\"").arg(title);
    }
    return QString();
}

bool MoveItemCommand::applied() const
{
    return m_applied;
}

std::vector<data::Item> *MoveItemCommand::destination()
{
    switch (m_kind) {
    case MoveKind::MarkDone:
        return &m_lists.done;
    case MoveKind::Archive:
        return &m_lists.archived;
    case MoveKind::Delete:
        return nullptr;
    }
    return nullptr;
}

} // namespace core
} // namespace daytrack

#include "daytrack/data/ItemTree.hpp"

#include <algorithm>

namespace daytrack {
namespace data {

namespace {
std::optional<ItemPath> parsePosition(const QString &position)
{
    const QStringList parts = position.split('.');
    if (parts.isEmpty() || parts.size() > 2) {
        return std::nullopt;
    }
    bool ok = false;
    ItemPath path;
    path.index = parts.at(0).toInt(&ok);
    if (!ok || path.index < 0) {
        return std::nullopt;
    }
    if (parts.size() == 2) {
        const int sub = parts.at(1).toInt(&ok);
        if (!ok || sub < 0) {
            return std::nullopt;
        }
        path.subIndex = sub;
    }
    return path;
}
} // namespace

void syncParentStatus(Item &parent, const QDateTime &now)
{
    if (!parent.hasSubtasks()) {
        return;
    }
    if (parent.hasRunningSubtask()) {
        if (parent.status != RunStatus::Running) {
            parent.start(now);
        }
        return;
    }
    const bool allPausedOrIdle = std::all_of(parent.subtasks.cbegin(), parent.subtasks.cend(), [](const Item &subtask) {
        return subtask.status == RunStatus::Paused || subtask.status == RunStatus::Idle;
    });
    if (allPausedOrIdle && parent.status == RunStatus::Running) {
        parent.pause(now);
    }
}

Totals computeTotals(const std::vector<Item> &items)
{
    Totals totals;
    for (const Item &item : items) {
        if (!item.hasSubtasks()) {
            totals.estimate += item.tracking.estimate;
            totals.elapsed += item.tracking.elapsed;
            continue;
        }
        for (const Item &subtask : item.subtasks) {
            totals.estimate += subtask.tracking.estimate;
            totals.elapsed += subtask.tracking.elapsed;
        }
    }
    return totals;
}

std::vector<ItemRow> flattenItems(const std::vector<Item> &items)
{
    std::vector<ItemRow> rows;
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        const Item &item = items[static_cast<std::size_t>(i)];
        rows.push_back(ItemRow{ItemPath{i, std::nullopt}, 0, &item});
        if (!item.expanded) {
            continue;
        }
        for (int j = 0; j < static_cast<int>(item.subtasks.size()); ++j) {
            rows.push_back(ItemRow{ItemPath{i, j}, 1, &item.subtasks[static_cast<std::size_t>(j)]});
        }
    }
    return rows;
}

Item *itemAt(std::vector<Item> &items, const ItemPath &path)
{
    return const_cast<Item *>(itemAt(static_cast<const std::vector<Item> &>(items), path));
}

const Item *itemAt(const std::vector<Item> &items, const ItemPath &path)
{
    if (path.index < 0 || path.index >= static_cast<int>(items.size())) {
        return nullptr;
    }
    const Item &item = items[static_cast<std::size_t>(path.index)];
    if (!path.subIndex) {
        return &item;
    }
    const int sub = *path.subIndex;
    if (sub < 0 || sub >= static_cast<int>(item.subtasks.size())) {
        return nullptr;
    }
    return &item.subtasks[static_cast<std::size_t>(sub)];
}

std::optional<ItemPath> findById(const std::vector<Item> &items, const QUuid &id)
{
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        const Item &item = items[static_cast<std::size_t>(i)];
        if (item.id == id) {
            return ItemPath{i, std::nullopt};
        }
        for (int j = 0; j < static_cast<int>(item.subtasks.size()); ++j) {
            if (item.subtasks[static_cast<std::size_t>(j)].id == id) {
                return ItemPath{i, j};
            }
        }
    }
    return std::nullopt;
}

void forEachItem(std::vector<Item> &items, const std::function<void(Item &)> &visit)
{
    for (Item &item : items) {
        visit(item);
        for (Item &subtask : item.subtasks) {
            visit(subtask);
        }
    }
}

QString durableKey(const std::vector<Item> &items, const ItemPath &path)
{
    const Item *item = itemAt(items, path);
    if (!item) {
        return QString();
    }
    const QString position = path.subIndex ? QStringLiteral("%1.%2").arg(path.index).arg(*path.subIndex)
                                           : QString::number(path.index);
    return position + QLatin1Char(':') + item->title;
}

std::optional<ItemPath> resolveDurableKey(const std::vector<Item> &items, const QString &key)
{
    const int colon = key.indexOf(':');
    if (colon <= 0) {
        return std::nullopt;
    }
    const std::optional<ItemPath> position = parsePosition(key.left(colon));
    if (!position) {
        return std::nullopt;
    }
    const QString title = key.mid(colon + 1);
    const Item *item = itemAt(items, *position);
    if (item && item->title == title) {
        return position;
    }

    // The record moved; fall back to the first item with the same title at the same depth.
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        const Item &candidate = items[static_cast<std::size_t>(i)];
        if (!position->subIndex) {
            if (candidate.title == title) {
                return ItemPath{i, std::nullopt};
            }
            continue;
        }
        for (int j = 0; j < static_cast<int>(candidate.subtasks.size()); ++j) {
            if (candidate.subtasks[static_cast<std::size_t>(j)].title == title) {
                return ItemPath{i, j};
            }
        }
    }
    return std::nullopt;
}

} // namespace data
} // namespace daytrack

#pragma once

#include "daytrack/data/Item.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace daytrack {
namespace data {

struct ItemPath
{
    int index = 0;
    std::optional<int> subIndex;

    bool isSubtask() const { return subIndex.has_value(); }
    bool operator==(const ItemPath &other) const { return index == other.index && subIndex == other.subIndex; }
    bool operator!=(const ItemPath &other) const { return !(*this == other); }
};

struct ItemRow
{
    ItemPath path;
    int depth = 0;
    const Item *item = nullptr;
};

struct Totals
{
    Duration estimate{0};
    Duration elapsed{0};
};

void syncParentStatus(Item &parent, const QDateTime &now);

// Parents with subtasks contribute only through their subtasks.
Totals computeTotals(const std::vector<Item> &items);

// Subtasks of collapsed parents are left out.
std::vector<ItemRow> flattenItems(const std::vector<Item> &items);

Item *itemAt(std::vector<Item> &items, const ItemPath &path);
const Item *itemAt(const std::vector<Item> &items, const ItemPath &path);
std::optional<ItemPath> findById(const std::vector<Item> &items, const QUuid &id);
void forEachItem(std::vector<Item> &items, const std::function<void(Item &)> &visit);

QString durableKey(const std::vector<Item> &items, const ItemPath &path);
std::optional<ItemPath> resolveDurableKey(const std::vector<Item> &items, const QString &key);

} // namespace data
} // namespace daytrack

#pragma once

#include "daytrack/data/Item.hpp"

#include <QDate>
#include <QString>

#include <vector>

namespace daytrack {
namespace data {

// Reads the entries of the legacy append-only completion log that were
// completed on `day`. Entries from other days are ignored.
std::vector<Item> readDoneLog(const QString &content, const QDate &day);

} // namespace data
} // namespace daytrack

#pragma once

#include "daytrack/data/Item.hpp"

#include <QDate>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace daytrack {
namespace data {

struct DayLists
{
    std::vector<Item> active;
    std::vector<Item> done;
    std::vector<Item> archived;

    bool isEmpty() const { return active.empty() && done.empty() && archived.empty(); }
};

class DailyFileCodec
{
public:
    // Never fails as a whole: malformed records are skipped and reported through
    // the log and, when given, `warnings`.
    static DayLists parse(const QString &content, ScheduleDay schedule = ScheduleDay::Today,
                          QStringList *warnings = nullptr);
    static QString serialize(const DayLists &lists, const QDate &date);

    static QString formatTimestamp(const QDateTime &timestamp);
    static QDateTime parseTimestamp(const QString &value);
    // "- <timestamp>: STATUS" or "- <timestamp>: FROM -> TO"
    static std::optional<StateEvent> parseHistoryEntry(const QString &entry);
    static QString formatHours(Duration duration);
    static std::optional<Duration> parseHours(const QString &value);
};

} // namespace data
} // namespace daytrack

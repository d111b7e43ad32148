#include "daytrack/data/DoneLogReader.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/DailyFileCodec.hpp"

#include <QStringList>

namespace daytrack {
namespace data {

namespace {
Duration hoursField(const QString &line, const QString &prefix)
{
    QString value = line.mid(prefix.size());
    return DailyFileCodec::parseHours(value).value_or(Duration(0));
}

Item parseEntry(const QStringList &lines, int &index, const QDateTime &completedAt)
{
    Item item;
    item.status = RunStatus::Done;
    item.completedAt = completedAt;
    QStringList notes;
    bool inNotes = false;
    bool inHistory = false;

    for (++index; index < lines.size(); ++index) {
        const QString &line = lines.at(index);
        if (line.startsWith(QLatin1String("## "))) {
            break;
        }
        if (inHistory && line.trimmed().startsWith(QLatin1String("- "))) {
            if (const std::optional<StateEvent> event = DailyFileCodec::parseHistoryEntry(line.trimmed())) {
                item.history.push_back(*event);
            } else {
                qCWarning(lcStorage) << "dropping malformed done log history entry" << line.trimmed();
            }
            continue;
        }
        inHistory = false;

        if (line.startsWith(QLatin1String("Task: \""))) {
            QString title = line.mid(7).trimmed();
            if (title.endsWith(QLatin1Char('"'))) {
                title.chop(1);
            }
            item.title = title;
            inNotes = false;
        } else if (line.startsWith(QLatin1String("Elapsed: "))) {
            item.tracking.elapsed = hoursField(line, QStringLiteral("Elapsed: "));
            inNotes = false;
        } else if (line.startsWith(QLatin1String("Estimate at finish: "))) {
            item.tracking.estimate = hoursField(line, QStringLiteral("Estimate at finish: "));
            inNotes = false;
        } else if (line.startsWith(QLatin1String("Estimate: "))) {
            item.tracking.estimate = hoursField(line, QStringLiteral("Estimate: "));
            inNotes = false;
        } else if (line.startsWith(QLatin1String("Tags: "))) {
            item.setTags(line.mid(6).split(QLatin1Char(','), Qt::SkipEmptyParts));
            inNotes = false;
        } else if (line.startsWith(QLatin1String("History:"))) {
            inHistory = true;
            inNotes = false;
        } else if (line.startsWith(QLatin1String("Notes:"))) {
            inNotes = true;
        } else if (inNotes && !line.trimmed().isEmpty()) {
            notes << line;
        }
    }

    item.setNotes(notes.join(QLatin1Char('\n')));
    item.createdAt = item.history.empty() ? completedAt : item.history.front().timestamp;
    if (item.history.empty() || item.history.back().to != RunStatus::Done) {
        const std::optional<RunStatus> previous =
            item.history.empty() ? std::optional<RunStatus>() : std::optional<RunStatus>(item.history.back().to);
        item.history.push_back(StateEvent{completedAt, previous, RunStatus::Done});
    }
    return item;
}
} // namespace

std::vector<Item> readDoneLog(const QString &content, const QDate &day)
{
    std::vector<Item> items;
    QStringList lines = content.split(QLatin1Char('\n'));
    for (QString &line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }

    int index = 0;
    while (index < lines.size()) {
        const QString line = lines.at(index).trimmed();
        if (!line.startsWith(QLatin1String("## "))) {
            ++index;
            continue;
        }
        const QDateTime completedAt = DailyFileCodec::parseTimestamp(line.mid(3));
        if (!completedAt.isValid() || completedAt.toLocalTime().date() != day) {
            ++index;
            continue;
        }
        Item item = parseEntry(lines, index, completedAt);
        if (item.title.isEmpty()) {
            qCWarning(lcStorage) << "skipping done log entry without a task title at" << completedAt;
            continue;
        }
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace data
} // namespace daytrack

#include "daytrack/data/DailyFileCodec.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/StateHistory.hpp"

#include <QRegularExpression>
#include <QTextStream>

#include <cmath>

namespace daytrack {
namespace data {

namespace {
constexpr auto LEGACY_TIMESTAMP_FORMAT = "yyyy-MM-dd HH:mm:ss";
constexpr int INDENT_WIDTH = 4;

enum class Section
{
    Active,
    Done,
    Archived,
};

int indentOf(const QString &line)
{
    int count = 0;
    for (const QChar ch : line) {
        if (ch == QLatin1Char(' ')) {
            ++count;
        } else if (ch == QLatin1Char('\t')) {
            count += INDENT_WIDTH;
        } else {
            break;
        }
    }
    return count;
}

bool isBlank(const QString &line)
{
    return line.trimmed().isEmpty();
}

QString stripIndent(const QString &line, int width)
{
    int cut = 0;
    while (cut < line.size() && cut < width && line.at(cut) == QLatin1Char(' ')) {
        ++cut;
    }
    return line.mid(cut);
}

QString hoursValue(Duration duration)
{
    return QString::number(static_cast<double>(duration.count()) / 3600000.0, 'f', 2);
}

QString eventText(const StateEvent &event)
{
    if (event.from) {
        return statusTag(*event.from) + QStringLiteral(" -> ") + statusTag(event.to);
    }
    return statusTag(event.to);
}

class RecordParser
{
public:
    RecordParser(const QStringList &lines, ScheduleDay schedule, QStringList *warnings)
        : m_lines(lines)
        , m_schedule(schedule)
        , m_warnings(warnings)
    {
    }

    DayLists parseAll()
    {
        DayLists lists;
        Section section = Section::Active;
        int i = 0;
        while (i < m_lines.size()) {
            const QString trimmed = m_lines.at(i).trimmed();
            if (trimmed.isEmpty()) {
                ++i;
                continue;
            }
            if (trimmed.startsWith(QLatin1String("## "))) {
                const QString name = trimmed.mid(3).trimmed().toUpper();
                if (name == QLatin1String("ACTIVE")) {
                    section = Section::Active;
                } else if (name == QLatin1String("DONE")) {
                    section = Section::Done;
                } else if (name == QLatin1String("ARCHIVED")) {
                    section = Section::Archived;
                } else {
                    warn(i, QStringLiteral("unknown section \"%1\"").arg(trimmed.mid(3).trimmed()));
                }
                ++i;
                continue;
            }
            if (trimmed.startsWith(QLatin1Char('#'))) {
                ++i;
                continue;
            }
            if (!trimmed.startsWith(QLatin1String("- ["))) {
                warn(i, QStringLiteral("unexpected line outside of a record"));
                ++i;
                continue;
            }
            std::optional<Item> item = parseRecord(i, 0);
            if (!item) {
                continue;
            }
            switch (section) {
            case Section::Active:
                lists.active.push_back(std::move(*item));
                break;
            case Section::Done:
                lists.done.push_back(std::move(*item));
                break;
            case Section::Archived:
                lists.archived.push_back(std::move(*item));
                break;
            }
        }
        return lists;
    }

private:
    // First line after `start` that is non-blank and not indented deeper than
    // `indent`; trailing blank lines stay outside the block.
    int blockEnd(int start, int indent) const
    {
        int end = start + 1;
        int lastContent = start;
        while (end < m_lines.size()) {
            const QString &line = m_lines.at(end);
            if (!isBlank(line)) {
                if (indentOf(line) <= indent) {
                    break;
                }
                lastContent = end;
            }
            ++end;
        }
        return lastContent + 1;
    }

    std::optional<Item> parseRecord(int &i, int depth)
    {
        const int headerLine = i;
        const int headerIndent = indentOf(m_lines.at(headerLine));
        const int end = blockEnd(headerLine, headerIndent);
        i = end;

        const QString header = m_lines.at(headerLine).trimmed();
        const int close = header.indexOf(QLatin1Char(']'));
        if (close < 0) {
            warn(headerLine, QStringLiteral("record header is missing ']'"));
            return std::nullopt;
        }
        const QString tag = header.mid(3, close - 3);
        const std::optional<RunStatus> status = statusFromTag(tag);
        if (!status) {
            warn(headerLine, QStringLiteral("unknown status tag [%1]").arg(tag));
            return std::nullopt;
        }
        const QString title = header.mid(close + 1).trimmed();
        if (title.isEmpty()) {
            warn(headerLine, QStringLiteral("record has an empty title"));
            return std::nullopt;
        }

        Item item;
        item.title = title;
        item.status = *status;
        item.schedule = m_schedule;

        int j = headerLine + 1;
        while (j < end) {
            const QString &line = m_lines.at(j);
            if (isBlank(line)) {
                ++j;
                continue;
            }
            const int fieldIndent = indentOf(line);
            const int fieldEnd = blockEnd(j, fieldIndent);
            parseField(item, j, fieldEnd, fieldIndent, depth);
            j = fieldEnd;
        }

        if (!item.createdAt.isValid() && !item.history.empty()) {
            item.createdAt = item.history.front().timestamp;
        }
        return item;
    }

    void parseField(Item &item, int line, int end, int indent, int depth)
    {
        const QString trimmed = m_lines.at(line).trimmed();
        const int colon = trimmed.indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            warn(line, QStringLiteral("ignoring unrecognized line in \"%1\"").arg(item.title));
            return;
        }
        const QString key = trimmed.left(colon).trimmed().toLower();
        const QString value = trimmed.mid(colon + 1).trimmed();

        if (key == QLatin1String("est") || key == QLatin1String("elapsed")) {
            const std::optional<Duration> hours = DailyFileCodec::parseHours(value);
            if (!hours) {
                warn(line, QStringLiteral("malformed duration \"%1\", using zero").arg(value));
            }
            Duration &target = key == QLatin1String("est") ? item.tracking.estimate : item.tracking.elapsed;
            target = hours.value_or(Duration(0));
        } else if (key == QLatin1String("tags")) {
            item.setTags(value.split(QLatin1Char(','), Qt::SkipEmptyParts));
        } else if (key == QLatin1String("notes")) {
            item.notes = value == QLatin1String("|") ? collectNotes(line + 1, end, indent + 2) : value;
        } else if (key == QLatin1String("created") || key == QLatin1String("completed")) {
            const QDateTime timestamp = DailyFileCodec::parseTimestamp(value);
            if (!timestamp.isValid()) {
                warn(line, QStringLiteral("malformed timestamp \"%1\"").arg(value));
                return;
            }
            (key == QLatin1String("created") ? item.createdAt : item.completedAt) = timestamp;
        } else if (key == QLatin1String("history")) {
            parseHistory(item, line + 1, end);
        } else if (key == QLatin1String("subtasks")) {
            if (depth >= 1) {
                warn(line, QStringLiteral("subtasks nested deeper than one level are dropped"));
                return;
            }
            parseSubtasks(item, line + 1, end, depth);
        } else if (key != QLatin1String("analytics")) {
            qCDebug(lcCodec) << "ignoring field" << key << "at line" << line + 1;
        }
    }

    QString collectNotes(int begin, int end, int indent) const
    {
        QStringList notes;
        for (int k = begin; k < end; ++k) {
            const QString &line = m_lines.at(k);
            notes << (isBlank(line) ? QString() : stripIndent(line, indent));
        }
        return notes.join(QLatin1Char('\n'));
    }

    void parseHistory(Item &item, int begin, int end)
    {
        for (int k = begin; k < end; ++k) {
            const QString trimmed = m_lines.at(k).trimmed();
            if (trimmed.isEmpty()) {
                continue;
            }
            std::optional<StateEvent> event = DailyFileCodec::parseHistoryEntry(trimmed);
            if (!event) {
                warn(k, QStringLiteral("dropping malformed history entry \"%1\"").arg(trimmed));
                continue;
            }
            item.history.push_back(*event);
        }
    }

    void parseSubtasks(Item &item, int begin, int end, int depth)
    {
        int k = begin;
        while (k < end) {
            const QString trimmed = m_lines.at(k).trimmed();
            if (!trimmed.startsWith(QLatin1String("- ["))) {
                if (!trimmed.isEmpty()) {
                    warn(k, QStringLiteral("unexpected line in subtasks of \"%1\"").arg(item.title));
                }
                ++k;
                continue;
            }
            std::optional<Item> subtask = parseRecord(k, depth + 1);
            if (subtask) {
                item.subtasks.push_back(std::move(*subtask));
            }
        }
    }

    void warn(int line, const QString &message)
    {
        qCWarning(lcCodec).noquote() << QStringLiteral("line %1:").arg(line + 1) << message;
        if (m_warnings) {
            m_warnings->append(QStringLiteral("line %1: %2").arg(line + 1).arg(message));
        }
    }

    const QStringList &m_lines;
    ScheduleDay m_schedule;
    QStringList *m_warnings = nullptr;
};

void writeItem(QTextStream &out, const Item &item, int depth, bool withAnalytics)
{
    const QString indent(depth * INDENT_WIDTH, QLatin1Char(' '));

    out << indent << "- [" << statusTag(item.status) << "] " << item.title << '\n';
    out << indent << "  est: " << DailyFileCodec::formatHours(item.tracking.estimate) << '\n';
    out << indent << "  elapsed: " << DailyFileCodec::formatHours(item.tracking.elapsed) << '\n';
    if (item.completedAt.isValid()) {
        out << indent << "  completed: " << DailyFileCodec::formatTimestamp(item.completedAt) << '\n';
    }
    if (!item.tags.isEmpty()) {
        out << indent << "  tags: " << item.tags.join(QStringLiteral(", ")) << '\n';
    }
    if (!item.notes.trimmed().isEmpty()) {
        out << indent << "  notes: |\n";
        for (const QString &line : item.notes.split(QLatin1Char('\n'))) {
            if (line.trimmed().isEmpty()) {
                out << '\n';
            } else {
                out << indent << "    " << line << '\n';
            }
        }
    }

    if (withAnalytics && item.status == RunStatus::Done) {
        out << indent << "  Analytics:\n";
        if (const std::optional<Duration> calendar = calendarTime(item)) {
            out << indent << "    Calendar Time: " << DailyFileCodec::formatHours(*calendar) << '\n';
        }
        out << indent << "    Active Time: " << DailyFileCodec::formatHours(runningTime(item, item.completedAt))
            << '\n';
        out << indent << "    Interruptions: " << interruptionCount(item) << '\n';
        out << indent << "    Sessions: " << sessionCount(item) << '\n';
    }

    if (item.createdAt.isValid()) {
        out << indent << "  created: " << DailyFileCodec::formatTimestamp(item.createdAt) << '\n';
    }
    if (!item.history.empty()) {
        out << indent << "  history:\n";
        for (const StateEvent &event : item.history) {
            out << indent << "    - " << DailyFileCodec::formatTimestamp(event.timestamp) << ": " << eventText(event)
                << '\n';
        }
    }

    if (item.hasSubtasks()) {
        out << indent << "  subtasks:\n";
        for (const Item &subtask : item.subtasks) {
            if (withAnalytics || isActiveStatus(subtask.status) || subtask.status == RunStatus::Done) {
                writeItem(out, subtask, depth + 1, withAnalytics);
            }
        }
    }
}
} // namespace

DayLists DailyFileCodec::parse(const QString &content, ScheduleDay schedule, QStringList *warnings)
{
    QStringList lines = content.split(QLatin1Char('\n'));
    for (QString &line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    RecordParser parser(lines, schedule, warnings);
    return parser.parseAll();
}

QString DailyFileCodec::serialize(const DayLists &lists, const QDate &date)
{
    QString output;
    QTextStream out(&output);

    out << "# " << date.toString(Qt::ISODate) << "\n\n";

    out << "## ACTIVE\n\n";
    for (const Item &item : lists.active) {
        if (isActiveStatus(item.status)) {
            writeItem(out, item, 0, false);
            out << '\n';
        }
    }

    if (!lists.done.empty()) {
        out << "## DONE\n\n";
        for (const Item &item : lists.done) {
            writeItem(out, item, 0, true);
            out << '\n';
        }
    }

    if (!lists.archived.empty()) {
        out << "## ARCHIVED\n\n";
        for (const Item &item : lists.archived) {
            writeItem(out, item, 0, false);
            out << '\n';
        }
    }

    out.flush();
    return output;
}

QString DailyFileCodec::formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return {};
    }
    const QDateTime withOffset = timestamp.toOffsetFromUtc(timestamp.offsetFromUtc());
    return withOffset.toString(withOffset.time().msec() == 0 ? Qt::ISODate : Qt::ISODateWithMs);
}

QDateTime DailyFileCodec::parseTimestamp(const QString &value)
{
    static const QRegularExpression longFraction(QStringLiteral("(\\.\\d{3})\\d+"));
    QString normalized = value.trimmed();
    normalized.replace(longFraction, QStringLiteral("\\1"));

    QDateTime timestamp = QDateTime::fromString(normalized, Qt::ISODateWithMs);
    if (!timestamp.isValid()) {
        timestamp = QDateTime::fromString(normalized, QLatin1String(LEGACY_TIMESTAMP_FORMAT));
    }
    return timestamp;
}

std::optional<StateEvent> DailyFileCodec::parseHistoryEntry(const QString &entry)
{
    if (!entry.startsWith(QLatin1String("- "))) {
        return std::nullopt;
    }
    const QString body = entry.mid(2);
    const int split = body.indexOf(QLatin1String(": "));
    if (split <= 0) {
        return std::nullopt;
    }
    StateEvent event;
    event.timestamp = parseTimestamp(body.left(split));
    if (!event.timestamp.isValid()) {
        return std::nullopt;
    }
    const QString transition = body.mid(split + 2).trimmed();
    const int arrow = transition.indexOf(QLatin1String("->"));
    const std::optional<RunStatus> to = statusFromTag(arrow < 0 ? transition : transition.mid(arrow + 2));
    if (!to) {
        return std::nullopt;
    }
    event.to = *to;
    if (arrow >= 0) {
        event.from = statusFromTag(transition.left(arrow));
        if (!event.from) {
            return std::nullopt;
        }
    }
    return event;
}

QString DailyFileCodec::formatHours(Duration duration)
{
    return hoursValue(duration) + QLatin1Char('h');
}

std::optional<Duration> DailyFileCodec::parseHours(const QString &value)
{
    QString number = value.trimmed();
    if (number.endsWith(QLatin1Char('h'), Qt::CaseInsensitive)) {
        number.chop(1);
    }
    bool ok = false;
    const double hours = number.trimmed().toDouble(&ok);
    if (!ok || hours < 0.0 || !std::isfinite(hours)) {
        return std::nullopt;
    }
    return Duration(qRound64(hours * 3600.0) * 1000);
}

} // namespace data
} // namespace daytrack

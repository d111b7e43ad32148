#include "daytrack/data/LegacyImporter.hpp"

#include "daytrack/core/Logging.hpp"
#include "daytrack/data/DoneLogReader.hpp"
#include "daytrack/data/Migration.hpp"

#include <QFile>
#include <QFileInfo>

namespace daytrack {
namespace data {

namespace {
bool hasContent(const QString &filePath)
{
    const QFileInfo info(filePath);
    return info.exists() && info.size() > 0;
}

void sortInto(DayLists &target, std::vector<Item> items, ScheduleDay schedule)
{
    for (Item &item : items) {
        item.schedule = schedule;
        if (item.status == RunStatus::Done) {
            target.done.push_back(std::move(item));
        } else if (isActiveStatus(item.status)) {
            target.active.push_back(std::move(item));
        }
    }
}
} // namespace

LegacyImporter::LegacyImporter(const DataDirectory &directory, DayRepository &repository)
    : m_directory(directory)
    , m_repository(repository)
{
}

bool LegacyImporter::hasLegacyData() const
{
    return hasContent(m_directory.legacyTodayFile()) || hasContent(m_directory.legacyTomorrowFile())
           || hasContent(m_directory.legacyDoneLogFile());
}

std::optional<int> LegacyImporter::run(const QDate &today, const QDateTime &now, QString *errorMessage)
{
    if (!hasLegacyData()) {
        return 0;
    }

    const std::optional<QString> todayContent = DataDirectory::readText(m_directory.legacyTodayFile(), errorMessage);
    if (!todayContent) {
        return std::nullopt;
    }
    const std::optional<QString> tomorrowContent =
        DataDirectory::readText(m_directory.legacyTomorrowFile(), errorMessage);
    if (!tomorrowContent) {
        return std::nullopt;
    }
    const std::optional<QString> doneLogContent =
        DataDirectory::readText(m_directory.legacyDoneLogFile(), errorMessage);
    if (!doneLogContent) {
        return std::nullopt;
    }

    DayLists imported;
    sortInto(imported, DailyFileCodec::parse(*todayContent).active, ScheduleDay::Today);
    sortInto(imported, DailyFileCodec::parse(*tomorrowContent).active, ScheduleDay::Today);
    for (Item &item : readDoneLog(*doneLogContent, today)) {
        imported.done.push_back(std::move(item));
    }

    const QDateTime stoppedAt = QFileInfo(m_directory.legacyTodayFile()).lastModified();
    Migration::repairActive(imported.active, stoppedAt, now);

    const int count = static_cast<int>(imported.active.size() + imported.done.size());
    if (count > 0) {
        std::optional<DayLists> merged = m_repository.loadDay(today, ScheduleDay::Today, errorMessage);
        if (!merged) {
            return std::nullopt;
        }
        for (Item &item : imported.active) {
            merged->active.push_back(std::move(item));
        }
        for (Item &item : imported.done) {
            merged->done.push_back(std::move(item));
        }
        if (!m_repository.saveDay(today, *merged, errorMessage)) {
            return std::nullopt;
        }
    }

    if (!cleanUp(now, errorMessage)) {
        return std::nullopt;
    }
    qCInfo(lcStorage) << "imported" << count << "items from the legacy layout into" << today;
    return count;
}

bool LegacyImporter::cleanUp(const QDateTime &now, QString *errorMessage)
{
    const QString todayFile = m_directory.legacyTodayFile();
    if (QFile::exists(todayFile) && !QFile::remove(todayFile)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot remove %1").arg(todayFile);
        }
        return false;
    }

    const QString tomorrowFile = m_directory.legacyTomorrowFile();
    if (QFile::exists(tomorrowFile) && !DataDirectory::writeAtomically(tomorrowFile, QString(), errorMessage)) {
        return false;
    }

    const QString doneLog = m_directory.legacyDoneLogFile();
    if (QFile::exists(doneLog)) {
        const QString backup = doneLog + QStringLiteral(".") + now.toString(QStringLiteral("yyyyMMdd-HHmmss")) + QStringLiteral(".bak");
        if (!QFile::rename(doneLog, backup)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("cannot move %1 to %2").arg(doneLog, backup);
            }
            return false;
        }
    }
    return true;
}

} // namespace data
} // namespace daytrack

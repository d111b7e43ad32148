#include "daytrack/data/FileDayRepository.hpp"

#include "daytrack/core/Logging.hpp"

#include <QFile>
#include <QFileInfo>

namespace daytrack {
namespace data {

FileDayRepository::FileDayRepository(DataDirectory directory)
    : m_directory(std::move(directory))
{
}

const DataDirectory &FileDayRepository::directory() const
{
    return m_directory;
}

bool FileDayRepository::hasDay(const QDate &date) const
{
    return QFileInfo::exists(m_directory.dailyFile(date));
}

std::optional<DayLists> FileDayRepository::loadDay(const QDate &date, ScheduleDay schedule,
                                                   QString *errorMessage) const
{
    const QString filePath = m_directory.dailyFile(date);
    const std::optional<QString> content = DataDirectory::readText(filePath, errorMessage);
    if (!content) {
        return std::nullopt;
    }
    QStringList warnings;
    DayLists lists = DailyFileCodec::parse(*content, schedule, &warnings);
    if (!warnings.isEmpty()) {
        qCWarning(lcStorage) << warnings.size() << "record problems while reading" << filePath;
    }
    return lists;
}

bool FileDayRepository::saveDay(const QDate &date, const DayLists &lists, QString *errorMessage)
{
    return DataDirectory::writeAtomically(m_directory.dailyFile(date), DailyFileCodec::serialize(lists, date),
                                          errorMessage);
}

QDateTime FileDayRepository::dayLastModified(const QDate &date) const
{
    const QFileInfo info(m_directory.dailyFile(date));
    if (!info.exists()) {
        return QDateTime();
    }
    return info.lastModified();
}

std::optional<QString> FileDayRepository::loadJournal(const QDate &date, QString *errorMessage) const
{
    return DataDirectory::readText(m_directory.journalFile(date), errorMessage);
}

bool FileDayRepository::saveJournal(const QDate &date, const QString &text, QString *errorMessage)
{
    return DataDirectory::writeAtomically(m_directory.journalFile(date), text, errorMessage);
}

std::optional<Metadata> FileDayRepository::loadMetadata(QString *errorMessage) const
{
    const QString filePath = m_directory.metadataFile();
    QFile file(filePath);
    if (!file.exists()) {
        return Metadata();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot read %1: %2").arg(filePath, file.errorString());
        }
        return std::nullopt;
    }

    QString parseError;
    std::optional<Metadata> metadata = MetadataStore::decode(file.readAll(), &parseError);
    if (!metadata) {
        qCWarning(lcStorage) << "ignoring malformed" << filePath << ":" << parseError;
        return Metadata();
    }
    return metadata;
}

bool FileDayRepository::saveMetadata(const Metadata &metadata, QString *errorMessage)
{
    return DataDirectory::writeAtomically(m_directory.metadataFile(), QString::fromUtf8(MetadataStore::encode(metadata)),
                                          errorMessage);
}

} // namespace data
} // namespace daytrack

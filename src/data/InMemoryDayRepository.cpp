#include "daytrack/data/InMemoryDayRepository.hpp"

namespace daytrack {
namespace data {

InMemoryDayRepository::InMemoryDayRepository() = default;
InMemoryDayRepository::~InMemoryDayRepository() = default;

bool InMemoryDayRepository::hasDay(const QDate &date) const
{
    return m_days.contains(date);
}

std::optional<DayLists> InMemoryDayRepository::loadDay(const QDate &date, ScheduleDay schedule, QString *) const
{
    if (!m_days.contains(date)) {
        return DayLists();
    }
    return DailyFileCodec::parse(m_days.value(date).content, schedule);
}

bool InMemoryDayRepository::saveDay(const QDate &date, const DayLists &lists, QString *)
{
    m_days.insert(date, StoredDay{DailyFileCodec::serialize(lists, date), QDateTime::currentDateTime()});
    return true;
}

QDateTime InMemoryDayRepository::dayLastModified(const QDate &date) const
{
    return m_days.value(date).lastModified;
}

std::optional<QString> InMemoryDayRepository::loadJournal(const QDate &date, QString *) const
{
    return m_journals.value(date);
}

bool InMemoryDayRepository::saveJournal(const QDate &date, const QString &text, QString *)
{
    m_journals.insert(date, text);
    return true;
}

std::optional<Metadata> InMemoryDayRepository::loadMetadata(QString *) const
{
    std::optional<Metadata> metadata = MetadataStore::decode(m_metadata);
    if (!metadata) {
        return Metadata();
    }
    return metadata;
}

bool InMemoryDayRepository::saveMetadata(const Metadata &metadata, QString *)
{
    m_metadata = MetadataStore::encode(metadata);
    return true;
}

void InMemoryDayRepository::putDayContent(const QDate &date, const QString &content, const QDateTime &lastModified)
{
    m_days.insert(date, StoredDay{content, lastModified});
}

QString InMemoryDayRepository::dayContent(const QDate &date) const
{
    return m_days.value(date).content;
}

void InMemoryDayRepository::putMetadataContent(const QByteArray &json)
{
    m_metadata = json;
}

} // namespace data
} // namespace daytrack

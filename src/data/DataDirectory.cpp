#include "daytrack/data/DataDirectory.hpp"

#include "daytrack/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include <algorithm>

namespace daytrack {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
} // namespace

DataDirectory::DataDirectory(QString path)
    : m_path(std::move(path))
{
}

QString DataDirectory::resolve(const QString &startDir, const QString &fallback)
{
    QDir dir(startDir);
    while (true) {
        const QFileInfo marker(dir.filePath(QLatin1String(MarkerName)));
        if (marker.isDir()) {
            return marker.absoluteFilePath();
        }
        if (!dir.cdUp()) {
            break;
        }
    }
    if (!fallback.isEmpty()) {
        return QDir(fallback).absolutePath();
    }
    return QDir::home().filePath(QLatin1String(MarkerName));
}

const QString &DataDirectory::path() const
{
    return m_path;
}

bool DataDirectory::ensureExists(QString *errorMessage) const
{
    QDir dir(m_path);
    if (dir.exists()) {
        return true;
    }
    if (dir.mkpath(QStringLiteral("."))) {
        qCInfo(lcStorage) << "created data directory" << m_path;
        return true;
    }
    if (errorMessage) {
        *errorMessage = QStringLiteral("cannot create data directory %1").arg(m_path);
    }
    return false;
}

QString DataDirectory::dailyFile(const QDate &date) const
{
    return filePath(date.toString(QLatin1String(DATE_FORMAT)) + QStringLiteral(".md"));
}

QString DataDirectory::journalFile(const QDate &date) const
{
    return filePath(QStringLiteral("journal-") + date.toString(QLatin1String(DATE_FORMAT)) + QStringLiteral(".md"));
}

QString DataDirectory::reportFile(const QDate &date) const
{
    return filePath(QStringLiteral("report-") + date.toString(QLatin1String(DATE_FORMAT)) + QStringLiteral(".md"));
}

QString DataDirectory::metadataFile() const
{
    return filePath(QStringLiteral("meta.json"));
}

QString DataDirectory::legacyTodayFile() const
{
    return filePath(QStringLiteral("today.md"));
}

QString DataDirectory::legacyTomorrowFile() const
{
    return filePath(QStringLiteral("tomorrow.md"));
}

QString DataDirectory::legacyDoneLogFile() const
{
    return filePath(QStringLiteral("done.log.md"));
}

std::vector<QDate> DataDirectory::dailyFiles() const
{
    std::vector<QDate> dates;
    const QStringList names = QDir(m_path).entryList({QStringLiteral("????-??-??.md")}, QDir::Files);
    for (const QString &name : names) {
        const QDate date = QDate::fromString(name.left(10), QLatin1String(DATE_FORMAT));
        if (date.isValid()) {
            dates.push_back(date);
        }
    }
    std::sort(dates.begin(), dates.end());
    return dates;
}

std::optional<QString> DataDirectory::readText(const QString &filePath, QString *errorMessage)
{
    QFile file(filePath);
    if (!file.exists()) {
        return QString();
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot read %1: %2").arg(filePath, file.errorString());
        }
        return std::nullopt;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return stream.readAll();
}

bool DataDirectory::writeAtomically(const QString &filePath, const QString &content, QString *errorMessage)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << content;
    stream.flush();

    if (stream.status() != QTextStream::Ok || !file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot commit %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    return true;
}

QString DataDirectory::filePath(const QString &name) const
{
    return QDir(m_path).filePath(name);
}

} // namespace data
} // namespace daytrack

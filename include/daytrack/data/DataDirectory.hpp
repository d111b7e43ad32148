#pragma once

#include <QDate>
#include <QString>

#include <optional>
#include <vector>

namespace daytrack {
namespace data {

class DataDirectory
{
public:
    static constexpr const char *MarkerName = ".daytrack";

    explicit DataDirectory(QString path);

    // Walks up from `startDir` looking for a `.daytrack` directory and falls back
    // to `fallback` (or `~/.daytrack` when empty).
    static QString resolve(const QString &startDir, const QString &fallback = QString());

    const QString &path() const;
    bool ensureExists(QString *errorMessage = nullptr) const;

    QString dailyFile(const QDate &date) const;
    QString journalFile(const QDate &date) const;
    QString reportFile(const QDate &date) const;
    QString metadataFile() const;
    QString legacyTodayFile() const;
    QString legacyTomorrowFile() const;
    QString legacyDoneLogFile() const;

    std::vector<QDate> dailyFiles() const;

    static std::optional<QString> readText(const QString &filePath, QString *errorMessage = nullptr);
    static bool writeAtomically(const QString &filePath, const QString &content, QString *errorMessage = nullptr);

private:
    QString filePath(const QString &name) const;

    QString m_path;
};

} // namespace data
} // namespace daytrack

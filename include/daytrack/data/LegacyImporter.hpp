#pragma once

#include "daytrack/data/DataDirectory.hpp"
#include "daytrack/data/DayRepository.hpp"

#include <optional>

namespace daytrack {
namespace data {

// Folds the older today.md / tomorrow.md / done.log.md layout into the daily
// record of `today`. The legacy files are removed, truncated or backed up
// afterwards, so running it again imports nothing.
class LegacyImporter
{
public:
    LegacyImporter(const DataDirectory &directory, DayRepository &repository);

    bool hasLegacyData() const;
    // Returns the number of imported items.
    std::optional<int> run(const QDate &today, const QDateTime &now, QString *errorMessage = nullptr);

private:
    bool cleanUp(const QDateTime &now, QString *errorMessage);

    const DataDirectory &m_directory;
    DayRepository &m_repository;
};

} // namespace data
} // namespace daytrack

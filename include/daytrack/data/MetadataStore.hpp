#pragma once

#include "daytrack/data/LifeMode.hpp"

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QStringList>

#include <array>
#include <optional>

namespace daytrack {
namespace data {

struct Metadata
{
    LifeMode mode = LifeMode::Working;
    // Durable keys ("index:title" or "index.sub:title") of the items a switch
    // away from Working paused.
    QStringList pausedByMode;
    std::array<qint64, LifeModeCount> modeSeconds{};
    QDateTime lastModeChange;

    qint64 secondsIn(LifeMode mode) const;
};

class MetadataStore
{
public:
    static QByteArray encode(const Metadata &metadata);
    static std::optional<Metadata> decode(const QByteArray &json, QString *errorMessage = nullptr);
    static bool resetIfStale(Metadata &metadata, const QDate &today);
};

} // namespace data
} // namespace daytrack

#include "daytrack/data/LifeMode.hpp"

namespace daytrack {
namespace data {

const std::array<LifeMode, LifeModeCount> &allLifeModes()
{
    static const std::array<LifeMode, LifeModeCount> modes = {
        LifeMode::Working, LifeMode::Break,    LifeMode::Lunch, LifeMode::Gym,
        LifeMode::Dinner,  LifeMode::Personal, LifeMode::Sleep,
    };
    return modes;
}

QString lifeModeName(LifeMode mode)
{
    switch (mode) {
    case LifeMode::Working:
        return QStringLiteral("Working");
    case LifeMode::Break:
        return QStringLiteral("Break");
    case LifeMode::Lunch:
        return QStringLiteral("Lunch");
    case LifeMode::Gym:
        return QStringLiteral("Gym");
    case LifeMode::Dinner:
        return QStringLiteral("Dinner");
    case LifeMode::Personal:
        return QStringLiteral("Personal");
    case LifeMode::Sleep:
        return QStringLiteral("Sleep");
    }
    return QStringLiteral("Working");
}

std::optional<LifeMode> lifeModeFromName(const QString &name)
{
    for (LifeMode mode : allLifeModes()) {
        if (lifeModeName(mode).compare(name.trimmed(), Qt::CaseInsensitive) == 0) {
            return mode;
        }
    }
    return std::nullopt;
}

bool lifeModePausesTimers(LifeMode mode)
{
    return mode != LifeMode::Working;
}

std::size_t lifeModeIndex(LifeMode mode)
{
    return static_cast<std::size_t>(mode);
}

} // namespace data
} // namespace daytrack

#pragma once

#include <QString>

#include <array>
#include <cstddef>
#include <optional>

namespace daytrack {
namespace data {

enum class LifeMode
{
    Working,
    Break,
    Lunch,
    Gym,
    Dinner,
    Personal,
    Sleep,
};

constexpr std::size_t LifeModeCount = 7;

const std::array<LifeMode, LifeModeCount> &allLifeModes();
QString lifeModeName(LifeMode mode);
std::optional<LifeMode> lifeModeFromName(const QString &name);
bool lifeModePausesTimers(LifeMode mode);
std::size_t lifeModeIndex(LifeMode mode);

} // namespace data
} // namespace daytrack

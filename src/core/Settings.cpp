#include "daytrack/core/Settings.hpp"

#include <QSettings>

namespace daytrack {
namespace core {

namespace {
int boundedValue(const QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    return ok ? qBound(minimum, value, maximum) : fallback;
}
} // namespace

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.tickIntervalMs = boundedValue(settings, QStringLiteral("timing/tickIntervalMs"), result.tickIntervalMs, 50, 5000);
    result.idleCheckMinutes =
        boundedValue(settings, QStringLiteral("timing/idleCheckMinutes"), result.idleCheckMinutes, 1, 24 * 60);
    result.idleGraceMinutes =
        boundedValue(settings, QStringLiteral("timing/idleGraceMinutes"), result.idleGraceMinutes, 1, 24 * 60);
    result.checkpointSeconds =
        boundedValue(settings, QStringLiteral("timing/checkpointSeconds"), result.checkpointSeconds, 5, 3600);
    result.defaultEstimateMinutes = boundedValue(settings, QStringLiteral("tasks/defaultEstimateMinutes"),
                                                 result.defaultEstimateMinutes, 0, 24 * 60);
    result.estimateStepMinutes =
        boundedValue(settings, QStringLiteral("tasks/estimateStepMinutes"), result.estimateStepMinutes, 1, 240);
    result.undoLimit = boundedValue(settings, QStringLiteral("undo/limit"), result.undoLimit, 1, 100);
    result.dataDirectory = settings.value(QStringLiteral("storage/directory")).toString();
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("timing/tickIntervalMs"), tickIntervalMs);
    settings.setValue(QStringLiteral("timing/idleCheckMinutes"), idleCheckMinutes);
    settings.setValue(QStringLiteral("timing/idleGraceMinutes"), idleGraceMinutes);
    settings.setValue(QStringLiteral("timing/checkpointSeconds"), checkpointSeconds);
    settings.setValue(QStringLiteral("tasks/defaultEstimateMinutes"), defaultEstimateMinutes);
    settings.setValue(QStringLiteral("tasks/estimateStepMinutes"), estimateStepMinutes);
    settings.setValue(QStringLiteral("undo/limit"), undoLimit);
    settings.setValue(QStringLiteral("storage/directory"), dataDirectory);
}

} // namespace core
} // namespace daytrack

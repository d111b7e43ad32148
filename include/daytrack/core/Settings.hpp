#pragma once

#include <QString>

class QSettings;

namespace daytrack {
namespace core {

struct Settings
{
    int tickIntervalMs = 250;
    int idleCheckMinutes = 30;
    int idleGraceMinutes = 30;
    int checkpointSeconds = 60;
    int defaultEstimateMinutes = 60;
    int estimateStepMinutes = 15;
    int undoLimit = 10;
    QString dataDirectory;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace daytrack

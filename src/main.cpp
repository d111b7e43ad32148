#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "version.h"

#include "daytrack/core/AppContext.hpp"
#include "daytrack/core/Logging.hpp"
#include "daytrack/core/Settings.hpp"

namespace {
std::atomic<bool> g_quitRequested{false};

void requestQuit(int)
{
    g_quitRequested = true;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("DayTrack"));
    QCoreApplication::setApplicationName(QStringLiteral("daytrack"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kDaytrackVersion));

    QCoreApplication app(argc, argv);
    std::signal(SIGINT, requestQuit);
    std::signal(SIGTERM, requestQuit);

    QSettings storedSettings;
    const daytrack::core::Settings settings = daytrack::core::Settings::load(storedSettings);

    daytrack::core::AppContext context(settings);
    QString error;
    if (!context.start(&error)) {
        qCCritical(lcStorage) << "cannot start:" << error;
        return 1;
    }
    qCInfo(lcTracker) << "DayTrack" << kDaytrackVersion << "started";

    QTimer ticker;
    QObject::connect(&ticker, &QTimer::timeout, &app, [&context, &app]() {
        if (g_quitRequested) {
            app.quit();
            return;
        }
        context.tick();
    });
    ticker.start(settings.tickIntervalMs);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&context]() {
        QString shutdownError;
        if (!context.shutdown(&shutdownError)) {
            qCCritical(lcStorage) << "shutdown failed:" << shutdownError;
        }
    });

    return app.exec();
}

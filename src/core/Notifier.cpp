#include "daytrack/core/Notifier.hpp"

#include "daytrack/core/Logging.hpp"

namespace daytrack {
namespace core {

QString notificationKindName(NotificationKind kind)
{
    switch (kind) {
    case NotificationKind::TaskDone:
        return QStringLiteral("task done");
    case NotificationKind::EstimateReached:
        return QStringLiteral("estimate reached");
    case NotificationKind::IdleCheck:
        return QStringLiteral("still working?");
    case NotificationKind::AutoPaused:
        return QStringLiteral("auto-paused");
    case NotificationKind::SaveFailed:
        return QStringLiteral("save failed");
    }
    return QString();
}

void LogNotifier::notify(NotificationKind kind, const QString &title)
{
    qCInfo(lcTracker).noquote() << QStringLiteral("[%1]").arg(notificationKindName(kind)) << title;
}

} // namespace core
} // namespace daytrack

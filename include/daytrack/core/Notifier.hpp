#pragma once

#include <QString>

namespace daytrack {
namespace core {

enum class NotificationKind
{
    TaskDone,
    EstimateReached,
    IdleCheck,
    AutoPaused,
    SaveFailed,
};

QString notificationKindName(NotificationKind kind);

// Fire-and-forget sink; implementations must not block or fail the caller.
class Notifier
{
public:
    virtual ~Notifier() = default;
    virtual void notify(NotificationKind kind, const QString &title) = 0;
};

class LogNotifier : public Notifier
{
public:
    void notify(NotificationKind kind, const QString &title) override;
};

} // namespace core
} // namespace daytrack

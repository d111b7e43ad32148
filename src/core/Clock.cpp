#include "daytrack/core/Clock.hpp"

namespace daytrack {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTime();
}

} // namespace core
} // namespace daytrack

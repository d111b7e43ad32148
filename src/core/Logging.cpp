#include "daytrack/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStorage, "daytrack.storage")
Q_LOGGING_CATEGORY(lcCodec, "daytrack.codec")
Q_LOGGING_CATEGORY(lcTracker, "daytrack.tracker")
Q_LOGGING_CATEGORY(lcMode, "daytrack.mode")

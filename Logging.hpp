#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcBroadcaster)
Q_DECLARE_LOGGING_CATEGORY(lcListener)
Q_DECLARE_LOGGING_CATEGORY(lcNet)

namespace Logging {
    // timestamped "category level: message" lines on stderr; verbose enables debug output
    void init(bool verbose);
}

#endif // LOGGING_HPP

#include "Logging.hpp"

Q_LOGGING_CATEGORY(lcBroadcaster, "statebeacon.broadcaster", QtInfoMsg)
Q_LOGGING_CATEGORY(lcListener, "statebeacon.listener", QtInfoMsg)
Q_LOGGING_CATEGORY(lcNet, "statebeacon.net", QtInfoMsg)

namespace Logging {

void init(bool verbose) {
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-ddThh:mm:ss.zzz} %{category} %{type}: %{message}"));
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("statebeacon.*.debug=true"));
    }
}

} // namespace Logging

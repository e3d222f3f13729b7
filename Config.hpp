#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "SubnetBroadcaster.hpp"
#include "SubnetListener.hpp"
#include <QString>
#include <QStringList>

enum class ParseResult {
    Ok,
    Error,
    Help
};

enum class MonitorKind {
    None,
    Curses,
    Qt
};

struct PublisherOptions {
    PublisherConfig config;
    MonitorKind monitor = MonitorKind::None;
    bool verbose = false;
};

struct ListenerOptions {
    ListenerConfig config;
    bool verbose = false;
};

// args includes the program name, as QCoreApplication::arguments() does.
// Does not need a QCoreApplication instance; the *_help_text() functions do.
ParseResult parse_publisher_options(const QStringList& args, PublisherOptions& out, QString& error);
ParseResult parse_listener_options(const QStringList& args, ListenerOptions& out, QString& error);

QString publisher_help_text();
QString listener_help_text();

#endif // CONFIG_HPP

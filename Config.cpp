#include "Config.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <cmath>
#include <limits>

namespace {

const QCommandLineOption kVerbose({"v", "verbose"}, "Enable debug logging.");

// shared by the publisher and the listener
const QCommandLineOption kPort({"p", "port"}, "UDP port the broadcasts go to.", "port",
                               QString::number(MessageCodec::DEFAULT_BROADCAST_PORT));

const QCommandLineOption kInterface({"i", "interface"},
                                    "Interface whose broadcast address is used.", "name");
const QCommandLineOption kBroadcastAddress({"b", "broadcast-address"},
                                           "Broadcast address; overrides interface discovery.", "ip");
const QCommandLineOption kAckPort({"a", "ack-port"}, "UDP port acknowledgments arrive on (0 = any).", "port",
                                  QString::number(MessageCodec::DEFAULT_ACK_PORT));
const QCommandLineOption kInterval("interval", "Seconds between broadcasts.", "seconds",
                                   QString::number(MessageCodec::DEFAULT_INTERVAL_SECONDS));
const QCommandLineOption kPublisherRuntime("max-runtime", "Stop after this many seconds (0 = unlimited).",
                                           "seconds", "0");
const QCommandLineOption kExpiry("expiry", "Forget listeners silent for this many seconds.", "seconds", "60");
const QCommandLineOption kUi("ui", "Monitor: none, curses or qt.", "kind", "none");

const QCommandLineOption kClientId({"c", "client-id"}, "Listener id (random when omitted).", "id");
const QCommandLineOption kListenerRuntime({"r", "max-runtime"}, "Stop after this many seconds (0 = unlimited).",
                                          "seconds", "300");
const QCommandLineOption kMaxMessages({"m", "max-messages"}, "Stop after this many messages (0 = unlimited).",
                                      "count", "0");

void setup_publisher(QCommandLineParser& parser) {
    parser.setApplicationDescription("Broadcasts a cycling station state and collects acknowledgments.");
    parser.addHelpOption();
    parser.addOptions({kInterface, kBroadcastAddress, kPort, kAckPort, kInterval, kPublisherRuntime,
                       kExpiry, kUi, kVerbose});
}

void setup_listener(QCommandLineParser& parser) {
    parser.setApplicationDescription("Receives station state broadcasts and acknowledges them.");
    parser.addHelpOption();
    parser.addOptions({kClientId, kPort, kListenerRuntime, kMaxMessages, kVerbose});
}

bool read_port(const QCommandLineParser& parser, const QCommandLineOption& opt, uint16_t& out, QString& error) {
    bool ok = false;
    uint value = parser.value(opt).toUInt(&ok);
    if (!ok || value > std::numeric_limits<uint16_t>::max()) {
        error = QString("invalid port for --%1: %2").arg(opt.names().last(), parser.value(opt));
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

bool read_seconds(const QCommandLineParser& parser, const QCommandLineOption& opt, double& out, QString& error) {
    bool ok = false;
    double value = parser.value(opt).toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0) {
        error = QString("invalid number of seconds for --%1: %2").arg(opt.names().last(), parser.value(opt));
        return false;
    }
    out = value;
    return true;
}

} // namespace

ParseResult parse_publisher_options(const QStringList& args, PublisherOptions& out, QString& error) {
    QCommandLineParser parser;
    setup_publisher(parser);
    if (!parser.parse(args)) {
        error = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet("help")) return ParseResult::Help;
    if (!parser.positionalArguments().isEmpty()) {
        error = "unexpected argument: " + parser.positionalArguments().first();
        return ParseResult::Error;
    }

    PublisherOptions opts;
    opts.config.interface_name = parser.value(kInterface).toStdString();
    opts.config.broadcast_address = parser.value(kBroadcastAddress).toStdString();
    if (!read_port(parser, kPort, opts.config.client_port, error)) return ParseResult::Error;
    if (!read_port(parser, kAckPort, opts.config.ack_port, error)) return ParseResult::Error;
    if (!read_seconds(parser, kInterval, opts.config.interval_seconds, error)) return ParseResult::Error;
    if (opts.config.interval_seconds <= 0) {
        error = "--interval must be positive";
        return ParseResult::Error;
    }
    if (!read_seconds(parser, kPublisherRuntime, opts.config.max_runtime, error)) return ParseResult::Error;
    double expiry = 0;
    if (!read_seconds(parser, kExpiry, expiry, error)) return ParseResult::Error;
    if (expiry * 1000 > static_cast<double>(std::numeric_limits<unsigned int>::max())) {
        error = "--expiry is too large: " + parser.value(kExpiry);
        return ParseResult::Error;
    }
    opts.config.expiry_ms = static_cast<unsigned int>(expiry * 1000);

    const QString ui = parser.value(kUi);
    if (ui == "none") {
        opts.monitor = MonitorKind::None;
    } else if (ui == "curses") {
        opts.monitor = MonitorKind::Curses;
    } else if (ui == "qt") {
        opts.monitor = MonitorKind::Qt;
    } else {
        error = "unknown --ui kind: " + ui;
        return ParseResult::Error;
    }
    opts.verbose = parser.isSet(kVerbose);

    out = opts;
    return ParseResult::Ok;
}

ParseResult parse_listener_options(const QStringList& args, ListenerOptions& out, QString& error) {
    QCommandLineParser parser;
    setup_listener(parser);
    if (!parser.parse(args)) {
        error = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet("help")) return ParseResult::Help;
    if (!parser.positionalArguments().isEmpty()) {
        error = "unexpected argument: " + parser.positionalArguments().first();
        return ParseResult::Error;
    }

    ListenerOptions opts;
    opts.config.client_id = parser.value(kClientId).toStdString();
    if (!read_port(parser, kPort, opts.config.client_port, error)) return ParseResult::Error;
    if (!read_seconds(parser, kListenerRuntime, opts.config.max_runtime, error)) return ParseResult::Error;

    bool ok = false;
    qlonglong count = parser.value(kMaxMessages).toLongLong(&ok);
    if (!ok || count < 0) {
        error = "invalid --max-messages: " + parser.value(kMaxMessages);
        return ParseResult::Error;
    }
    opts.config.max_messages = count;
    opts.verbose = parser.isSet(kVerbose);

    out = opts;
    return ParseResult::Ok;
}

QString publisher_help_text() {
    QCommandLineParser parser;
    setup_publisher(parser);
    return parser.helpText();
}

QString listener_help_text() {
    QCommandLineParser parser;
    setup_listener(parser);
    return parser.helpText();
}

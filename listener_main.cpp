#include "Config.hpp"
#include "Logging.hpp"
#include "SubnetListener.hpp"
#include <QCoreApplication>
#include <QJsonDocument>
#include <atomic>
#include <csignal>
#include <iostream>

static std::atomic<SubnetListener*> g_listener(nullptr);

// request_stop() only stores an atomic flag
void sigint_handler(int) {
    SubnetListener* listener = g_listener.load();
    if (listener) listener->request_stop();
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("statebeacon-listener");

    ListenerOptions opts;
    QString error;
    switch (parse_listener_options(app.arguments(), opts, error)) {
        case ParseResult::Help:
            std::cout << listener_help_text().toStdString();
            return 0;
        case ParseResult::Error:
            std::cerr << error.toStdString() << "\n";
            return 1;
        case ParseResult::Ok:
            break;
    }
    Logging::init(opts.verbose);

    SubnetListener listener(opts.config);
    if (!listener.init()) {
        std::cerr << "Listener start failed\n";
        return 2;
    }

    g_listener.store(&listener);
    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    ListenerSummary summary = listener.run();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_listener.store(nullptr);

    std::cout << QJsonDocument(summary.to_json()).toJson(QJsonDocument::Indented).toStdString();
    return 0;
}

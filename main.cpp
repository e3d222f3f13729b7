#include "BroadcastAddress.hpp"
#include "Config.hpp"
#include "Logging.hpp"
#include "SubnetBroadcaster.hpp"
#include "UI.hpp"
#include "UIQt.hpp"
#include <QApplication>
#include <QCoreApplication>
#include <QTimer>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static std::atomic<bool> g_terminate(false);

// Signal handler sets a flag only (async-signal-safe)
void sigint_handler(int) {
    g_terminate.store(true);
}

int main(int argc, char* argv[]) {
    QStringList args;
    for (int i = 0; i < argc; ++i) args << QString::fromLocal8Bit(argv[i]);

    PublisherOptions opts;
    QString error;
    switch (parse_publisher_options(args, opts, error)) {
        case ParseResult::Help: {
            QCoreApplication app(argc, argv);
            std::cout << publisher_help_text().toStdString();
            return 0;
        }
        case ParseResult::Error:
            std::cerr << error.toStdString() << "\n";
            return 1;
        case ParseResult::Ok:
            break;
    }

    // the Qt monitor needs a QApplication; everything else only uses QtCore
    std::unique_ptr<QCoreApplication> app;
    if (opts.monitor == MonitorKind::Qt) {
        app.reset(new QApplication(argc, argv));
    } else {
        app.reset(new QCoreApplication(argc, argv));
    }
    QCoreApplication::setApplicationName("statebeacon-publisher");
    Logging::init(opts.verbose);

    if (opts.config.broadcast_address.empty()) {
        opts.config.broadcast_address = resolve_broadcast_address(opts.config.interface_name);
    }

    SubnetBroadcaster bc(opts.config);
    if (!bc.init()) {
        std::cerr << "Init failed\n";
        return 2;
    }

    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    if (!bc.start()) {
        std::cerr << "Broadcaster start failed\n";
        return 3;
    }

    const auto started = std::chrono::steady_clock::now();
    const double max_runtime = opts.config.max_runtime;
    auto keep_running = [started, max_runtime]() {
        if (g_terminate.load()) return false;
        if (max_runtime <= 0) return true;
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() <= max_runtime;
    };

    switch (opts.monitor) {
        case MonitorKind::Qt: {
            UIQt w(bc);
            w.show();
            QTimer watchdog;
            QObject::connect(&watchdog, &QTimer::timeout, [&keep_running]() {
                if (!keep_running()) QCoreApplication::quit();
            });
            watchdog.start(200);
            app->exec();
            break;
        }
        case MonitorKind::Curses: {
            UI ui(bc);
            if (ui.init()) {
                ui.run(keep_running);
                break;
            }
            std::cerr << "UI init failed, falling back to console mode\n";
            while (keep_running()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
            break;
        }
        case MonitorKind::None:
            while (keep_running()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
            break;
    }

    // clean shutdown
    bc.stop();
    PublisherStatus st = bc.status();
    qCInfo(lcBroadcaster) << "stopped after" << st.messages_sent << "broadcasts," << st.send_failures
                          << "failed," << st.acks_received << "acks from" << bc.get_listeners().size()
                          << "listeners";
    return 0;
}

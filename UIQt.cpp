#include "UIQt.hpp"
#include <QHBoxLayout>
#include <QHeaderView>
#include <QVBoxLayout>
#include <QtWidgets/QTableWidgetItem>
#include <chrono>

UIQt::UIQt(SubnetBroadcaster& bc, QWidget* parent)
    : QMainWindow(parent), bc_(bc) {
    buildUi();
    refreshTimer_ = new QTimer(this);
    connect(refreshTimer_, &QTimer::timeout, this, &UIQt::refresh);
    refreshTimer_->start(500);
    refresh();
}

UIQt::~UIQt() {}

void UIQt::buildUi() {
    setWindowTitle(QString("StateBeacon - %1:%2")
                       .arg(QString::fromStdString(bc_.broadcast_address()))
                       .arg(bc_.port()));

    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    auto* layout = new QVBoxLayout(central);

    statusLabel_ = new QLabel(this);
    layout->addWidget(statusLabel_);

    listenersTable_ = new QTableWidget(0, 5, this);
    listenersTable_->setHorizontalHeaderLabels({"Listener", "Acks", "First seen", "Last seen", "Last ack"});
    listenersTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    layout->addWidget(listenersTable_);

    auto* h = new QHBoxLayout();
    broadcastBtn_ = new QPushButton("Broadcast now", this);
    pruneBtn_ = new QPushButton("Forget stale", this);
    h->addWidget(broadcastBtn_);
    h->addWidget(pruneBtn_);
    layout->addLayout(h);

    connect(broadcastBtn_, &QPushButton::clicked, [this]() {
        bc_.request_broadcast();
    });
    connect(pruneBtn_, &QPushButton::clicked, [this]() {
        bc_.prune_stale(std::chrono::steady_clock::now());
        refresh();
    });
}

void UIQt::refresh() {
    PublisherStatus st = bc_.status();
    statusLabel_->setText(QString("Next id %1, next state %2 | sent %3, failed %4 | acks %5 on port %6")
                              .arg(st.next_message_id)
                              .arg(QString::fromStdString(MessageCodec::name_for(st.next_state)))
                              .arg(st.messages_sent)
                              .arg(st.send_failures)
                              .arg(st.acks_received)
                              .arg(bc_.ack_port()));

    auto listeners = bc_.get_listeners();
    auto now = std::chrono::steady_clock::now();
    listenersTable_->setRowCount(0);
    int r = 0;
    for (const auto& [key, info] : listeners) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - info.last_seen).count();
        listenersTable_->insertRow(r);
        listenersTable_->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(key)));
        listenersTable_->setItem(r, 1, new QTableWidgetItem(QString::number(info.ack_count)));
        listenersTable_->setItem(r, 2, new QTableWidgetItem(QString::fromStdString(info.first_seen)));
        listenersTable_->setItem(r, 3, new QTableWidgetItem(QString("%1 s ago").arg(age)));
        listenersTable_->setItem(r, 4, new QTableWidgetItem(QString::fromStdString(info.last_ack)));
        ++r;
    }
}

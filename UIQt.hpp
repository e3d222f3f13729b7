#ifndef UIQT_HPP
#define UIQT_HPP

#include <QLabel>
#include <QMainWindow>
#include <QPushButton>
#include <QTableWidget>
#include <QTimer>
#include "SubnetBroadcaster.hpp"

class UIQt : public QMainWindow {
public:
    explicit UIQt(SubnetBroadcaster& bc, QWidget* parent = nullptr);
    ~UIQt();

private:
    SubnetBroadcaster& bc_;

    QLabel* statusLabel_;
    QTableWidget* listenersTable_;
    QPushButton* broadcastBtn_;
    QPushButton* pruneBtn_;
    QTimer* refreshTimer_;

    void buildUi();
    void refresh();
};

#endif // UIQT_HPP

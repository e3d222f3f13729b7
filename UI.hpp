#ifndef UI_HPP
#define UI_HPP

#include "SubnetBroadcaster.hpp"
#include <functional>

// Minimal ncurses-based monitor: publisher status and the listeners that acknowledged.
class UI {
public:
    explicit UI(SubnetBroadcaster& bc);
    ~UI();

    // Initialize ncurses, returns false on failure
    bool init();
    // Run until the user quits or keep_running returns false
    void run(const std::function<bool()>& keep_running);

private:
    SubnetBroadcaster& bc_;
    bool running_;
    bool initialized_;

    void draw();
    void handle_input();
};

#endif // UI_HPP

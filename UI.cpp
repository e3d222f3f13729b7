#include "UI.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <ncurses.h>

UI::UI(SubnetBroadcaster& bc)
    : bc_(bc), running_(false), initialized_(false) {}

UI::~UI() {
    if (initialized_) endwin();
}

bool UI::init() {
    if (initscr() == nullptr) return false;
    initialized_ = true;
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    curs_set(0);
    return true;
}

void UI::draw() {
    clear();
    mvprintw(0, 0, "StateBeacon - broadcasting to %s:%u, acks on %u (q to quit, b to broadcast now)",
             bc_.broadcast_address().c_str(), static_cast<unsigned>(bc_.port()), static_cast<unsigned>(bc_.ack_port()));

    PublisherStatus st = bc_.status();
    mvprintw(1, 0, "next id %lld  next state %s  sent %llu  failed %llu  acks %llu",
             static_cast<long long>(st.next_message_id), MessageCodec::name_for(st.next_state).c_str(),
             static_cast<unsigned long long>(st.messages_sent),
             static_cast<unsigned long long>(st.send_failures),
             static_cast<unsigned long long>(st.acks_received));

    auto listeners = bc_.get_listeners();
    mvprintw(3, 0, "%-22s  %-6s  %-24s  %s", "Listener", "Acks", "First seen", "Last ack");
    int row = 4;
    auto now = std::chrono::steady_clock::now();
    for (const auto& [key, info] : listeners) {
        if (row >= LINES - 1) break;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - info.last_seen).count();
        mvprintw(row++, 0, "%-22s  %-6llu  %-24s  %s (%llds ago)", key.c_str(),
                 static_cast<unsigned long long>(info.ack_count), info.first_seen.c_str(),
                 info.last_ack.c_str(), static_cast<long long>(age));
    }
    if (listeners.empty()) mvprintw(row, 0, "(no acknowledgments yet)");
    refresh();
}

void UI::handle_input() {
    int ch = getch();
    if (ch == ERR) return;
    if (ch == 'q' || ch == 'Q') {
        running_ = false;
        return;
    }
    if (ch == 'b' || ch == 'B') {
        bc_.request_broadcast();
        return;
    }
}

void UI::run(const std::function<bool()>& keep_running) {
    running_ = true;
    while (running_ && keep_running()) {
        draw();
        handle_input();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

#ifndef POLLER_HPP
#define POLLER_HPP

#include <cstdint>
#include <unordered_map>
#include <vector>

// What a registered descriptor is for. Resolved once at registration; dispatch is a switch.
enum class SourceKind : uint8_t {
    BroadcastReceive,
    AckReceive
};

struct ReadyEvent {
    int fd;
    SourceKind kind;
    uint32_t events;
};

// epoll-backed readiness multiplexer (level-triggered, read interest only).
class Poller {
public:
    Poller();
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    bool open();
    void close();
    bool is_open() const { return epfd_ >= 0; }

    bool add(int fd, SourceKind kind);
    void remove(int fd);
    std::size_t size() const { return sources_.size(); }

    // Waits at most timeout_ms. Returns the number of ready events (0 on timeout or EINTR),
    // -1 on failure.
    int wait(int timeout_ms, std::vector<ReadyEvent>& out);

private:
    int epfd_;
    std::unordered_map<int, SourceKind> sources_;
};

#endif // POLLER_HPP

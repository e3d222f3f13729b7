#ifndef SUBNET_BROADCASTER_HPP
#define SUBNET_BROADCASTER_HPP

#include "MessageCodec.hpp"
#include "Poller.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <string>
#include <thread>

struct PublisherConfig {
    std::string interface_name;
    // injected at startup; the limited broadcast address is used when empty
    std::string broadcast_address;
    uint16_t client_port = MessageCodec::DEFAULT_BROADCAST_PORT;
    // 0 binds an ephemeral port
    uint16_t ack_port = MessageCodec::DEFAULT_ACK_PORT;
    double interval_seconds = MessageCodec::DEFAULT_INTERVAL_SECONDS;
    double max_runtime = 0;
    unsigned int expiry_ms = 60000;
};

struct PublisherState {
    int64_t next_message_id = 0;
    std::size_t current_state_index = 0;
    std::string broadcast_address;
    double interval_seconds = MessageCodec::DEFAULT_INTERVAL_SECONDS;
    bool exhausted = false;

    // Builds the next message and advances id and state. False once the id space is used up.
    bool next_message(const std::string& timestamp, BroadcastMessage& out);
};

// A listener that acknowledged at least once, keyed by "ip:port".
struct ListenerInfo {
    std::string ip;
    uint16_t port;
    std::string last_ack;
    uint64_t ack_count;
    std::string first_seen;
    std::chrono::steady_clock::time_point last_seen;
};

struct PublisherStatus {
    int64_t next_message_id = 0;
    StationState next_state = StationState::Active;
    uint64_t messages_sent = 0;
    uint64_t send_failures = 0;
    uint64_t acks_received = 0;
};

class SubnetBroadcaster {
public:
    explicit SubnetBroadcaster(const PublisherConfig& config = PublisherConfig());
    ~SubnetBroadcaster();

    SubnetBroadcaster(const SubnetBroadcaster&) = delete;
    SubnetBroadcaster& operator=(const SubnetBroadcaster&) = delete;

    bool init();
    // runs tick/poll_acks on a worker thread until stop()
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    // Broadcasts if the interval has elapsed (or a broadcast was requested).
    // Returns true when a message was built, whether or not the send succeeded.
    bool tick(std::chrono::steady_clock::time_point now);
    // Waits up to timeout_ms for acks and drains them. Returns the number read.
    int poll_acks(int timeout_ms);
    void request_broadcast();
    std::size_t prune_stale(std::chrono::steady_clock::time_point now);

    std::map<std::string, ListenerInfo> get_listeners();
    PublisherStatus status();

    // not synchronized; for use from the thread that drives tick()
    const PublisherState& state() const { return state_; }

    std::string broadcast_address() const { return state_.broadcast_address; }
    uint16_t port() const { return config_.client_port; }
    uint16_t ack_port() const { return ack_port_; }

private:
    PublisherConfig config_;
    PublisherState state_;
    int sockfd_;
    int ack_sockfd_;
    uint16_t ack_port_;
    struct sockaddr_in dest_;
    Poller poller_;
    std::optional<std::chrono::steady_clock::time_point> last_broadcast_;
    bool exhaustion_logged_;
    std::atomic<bool> running_;
    std::atomic<bool> broadcast_requested_;
    std::thread worker_;

    std::mutex listeners_mutex_;
    std::map<std::string, ListenerInfo> listeners_;
    PublisherStatus status_;

    void run_loop();
    bool send_message(const BroadcastMessage& msg);
    int drain_acks(int fd);
    void record_ack(const struct sockaddr_in& sender, const std::string& text);
    void close_sockets();
};

#endif // SUBNET_BROADCASTER_HPP

#ifndef SUBNET_LISTENER_HPP
#define SUBNET_LISTENER_HPP

#include "MessageCodec.hpp"
#include "Poller.hpp"
#include "StateTracker.hpp"
#include <QJsonObject>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <netinet/in.h>
#include <string>
#include <utility>
#include <vector>

struct ListenerConfig {
    // a random 8-character id is generated when empty
    std::string client_id;
    // 0 binds an ephemeral port
    uint16_t client_port = MessageCodec::DEFAULT_BROADCAST_PORT;
    // seconds, 0 = unlimited
    double max_runtime = 300;
    // 0 = unlimited
    int64_t max_messages = 0;
};

struct ReceivedRecord {
    std::string server_ip;
    uint16_t server_port;
    std::string timestamp;
    std::string receive_time;
    StationState state;
    int64_t message_id;
    // the state text the publisher sent
    std::string state_name;
};

enum class ExitReason : uint8_t {
    Unset,
    MaxRuntime,
    MaxMessages,
    Interrupted,
    IdleHook,
    PollFailure
};

enum class LoopState : uint8_t {
    Idle,
    Running,
    Exiting,
    Stopped
};

enum class HandleResult : uint8_t {
    Accepted,
    Duplicate,
    DecodeError,
    NoData,
    ReceiveError
};

const char* exit_reason_name(ExitReason reason);

// Dedup ratchet and message history for one listener run.
class ListenerSession {
public:
    ListenerSession(const std::string& client_id, double max_runtime, int64_t max_messages);

    // Appends a record iff msg.message_id > last_processed_id. Returns whether it did.
    bool accept(const BroadcastMessage& msg, const std::string& server_ip, uint16_t server_port);
    ExitReason check_liveness(double elapsed_seconds) const;

    void mark_started(std::chrono::steady_clock::time_point now);
    double elapsed_seconds(std::chrono::steady_clock::time_point now) const;

    const std::string& client_id() const { return client_id_; }
    int64_t last_processed_id() const { return last_processed_id_; }
    const std::vector<ReceivedRecord>& received_messages() const { return received_messages_; }
    double max_runtime() const { return max_runtime_; }
    int64_t max_messages() const { return max_messages_; }
    const StateTracker& tracker() const { return tracker_; }

private:
    std::string client_id_;
    int64_t last_processed_id_;
    std::vector<ReceivedRecord> received_messages_;
    std::chrono::steady_clock::time_point start_time_;
    double max_runtime_;
    int64_t max_messages_;
    StateTracker tracker_;
};

struct ListenerSummary {
    std::string client_id;
    uint16_t port = 0;
    std::string start_time;
    std::string end_time;
    double runtime_seconds = 0;
    std::size_t messages_received = 0;
    int64_t last_processed_id = -1;
    ExitReason exit_reason = ExitReason::Unset;
    int state_loops = 0;
    std::vector<ReceivedRecord> received_messages;

    QJsonObject to_json() const;
};

class SubnetListener {
public:
    // Called once per loop iteration with the elapsed seconds and the number of readiness
    // events so far. Returning false stops the loop.
    using IdleHook = std::function<bool(const ListenerSession&, double, std::size_t)>;

    explicit SubnetListener(const ListenerConfig& config = ListenerConfig());
    ~SubnetListener();

    SubnetListener(const SubnetListener&) = delete;
    SubnetListener& operator=(const SubnetListener&) = delete;

    // Creates and binds both sockets and registers the receive socket. On success the
    // listener is Running.
    bool init();
    // Blocks until a liveness bound, an interrupt or the idle hook ends the loop.
    ListenerSummary run();
    // safe to call from a signal handler or another thread
    void request_stop();

    HandleResult receive_one(int fd);
    HandleResult handle_datagram(const char* data, std::size_t len, const struct sockaddr_in& sender);

    void set_idle_hook(IdleHook hook) { idle_hook_ = std::move(hook); }

    const ListenerSession& session() const { return session_; }
    LoopState state() const { return state_.load(); }
    uint16_t port() const { return port_; }
    uint64_t acks_sent() const { return acks_sent_; }

private:
    ListenerConfig config_;
    ListenerSession session_;
    int sockfd_;
    int response_sockfd_;
    uint16_t port_;
    Poller poller_;
    std::atomic<LoopState> state_;
    std::atomic<bool> stop_requested_;
    IdleHook idle_hook_;
    uint64_t acks_sent_;

    bool send_ack(const std::string& ip, uint16_t port, int64_t message_id);
    void shutdown();
};

#endif // SUBNET_LISTENER_HPP

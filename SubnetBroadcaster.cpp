#include "SubnetBroadcaster.hpp"
#include "Logging.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace {
// bounded ack wait per worker iteration; also how quickly stop() is noticed
constexpr int kAckPollMs = 50;
}

bool PublisherState::next_message(const std::string& timestamp, BroadcastMessage& out) {
    if (exhausted) return false;

    out.message_id = next_message_id;
    out.timestamp = timestamp;
    out.state = MessageCodec::STATE_CYCLE[current_state_index];

    if (next_message_id >= MessageCodec::MAX_MESSAGE_ID) {
        exhausted = true;
    } else {
        ++next_message_id;
    }
    current_state_index = (current_state_index + 1) % MessageCodec::STATE_CYCLE.size();
    return true;
}

SubnetBroadcaster::SubnetBroadcaster(const PublisherConfig& config)
    : config_(config), sockfd_(-1), ack_sockfd_(-1), ack_port_(0), dest_{}, exhaustion_logged_(false),
      running_(false), broadcast_requested_(false) {
    state_.broadcast_address = config_.broadcast_address.empty()
        ? std::string(MessageCodec::FALLBACK_BROADCAST_ADDRESS) : config_.broadcast_address;
    state_.interval_seconds = config_.interval_seconds;
}

SubnetBroadcaster::~SubnetBroadcaster() {
    stop();
    close_sockets();
}

bool SubnetBroadcaster::init() {
    if (sockfd_ >= 0) return true;

    std::memset(&dest_, 0, sizeof(dest_));
    dest_.sin_family = AF_INET;
    dest_.sin_port = htons(config_.client_port);
    if (inet_pton(AF_INET, state_.broadcast_address.c_str(), &dest_.sin_addr) != 1) {
        qCCritical(lcBroadcaster) << "invalid broadcast address" << state_.broadcast_address.c_str();
        return false;
    }

    sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) {
        qCCritical(lcBroadcaster) << "socket failed:" << std::strerror(errno);
        return false;
    }

    int on = 1;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        qCCritical(lcBroadcaster) << "setsockopt SO_BROADCAST failed:" << std::strerror(errno);
        close_sockets();
        return false;
    }

    ack_sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (ack_sockfd_ < 0) {
        qCCritical(lcBroadcaster) << "ack socket failed:" << std::strerror(errno);
        close_sockets();
        return false;
    }
    if (setsockopt(ack_sockfd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
        qCWarning(lcBroadcaster) << "setsockopt SO_REUSEADDR failed:" << std::strerror(errno);
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(config_.ack_port);
    if (bind(ack_sockfd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        qCCritical(lcBroadcaster) << "bind ack port" << config_.ack_port << "failed:" << std::strerror(errno);
        close_sockets();
        return false;
    }

    struct sockaddr_in actual{};
    socklen_t alen = sizeof(actual);
    if (getsockname(ack_sockfd_, reinterpret_cast<struct sockaddr*>(&actual), &alen) < 0) {
        qCCritical(lcBroadcaster) << "getsockname failed:" << std::strerror(errno);
        close_sockets();
        return false;
    }
    ack_port_ = ntohs(actual.sin_port);

    int flags = fcntl(ack_sockfd_, F_GETFL, 0);
    if (flags < 0 || fcntl(ack_sockfd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        qCCritical(lcBroadcaster) << "fcntl O_NONBLOCK failed:" << std::strerror(errno);
        close_sockets();
        return false;
    }

    if (!poller_.open() || !poller_.add(ack_sockfd_, SourceKind::AckReceive)) {
        close_sockets();
        return false;
    }

    qCInfo(lcBroadcaster) << "broadcasting to" << state_.broadcast_address.c_str() << "port" << config_.client_port
                          << "every" << state_.interval_seconds << "s, acks on port" << ack_port_;
    return true;
}

bool SubnetBroadcaster::start() {
    if (sockfd_ < 0) {
        qCWarning(lcBroadcaster) << "socket not initialized, call init() first";
        return false;
    }
    if (running_.exchange(true)) {
        qCWarning(lcBroadcaster) << "already running";
        return false;
    }
    worker_ = std::thread(&SubnetBroadcaster::run_loop, this);
    return true;
}

void SubnetBroadcaster::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (worker_.joinable()) worker_.join();
    close_sockets();
}

void SubnetBroadcaster::close_sockets() {
    poller_.close();
    if (ack_sockfd_ >= 0) {
        ::close(ack_sockfd_);
        ack_sockfd_ = -1;
    }
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

void SubnetBroadcaster::request_broadcast() {
    broadcast_requested_.store(true);
}

bool SubnetBroadcaster::tick(std::chrono::steady_clock::time_point now) {
    if (sockfd_ < 0) return false;

    bool forced = broadcast_requested_.exchange(false);
    if (!forced && last_broadcast_
        && now - *last_broadcast_ < std::chrono::duration<double>(state_.interval_seconds)) {
        return false;
    }

    BroadcastMessage msg;
    if (!state_.next_message(MessageCodec::now_iso8601(), msg)) {
        if (!exhaustion_logged_) {
            qCCritical(lcBroadcaster) << "message id space exhausted, broadcasting stopped";
            exhaustion_logged_ = true;
        }
        return false;
    }
    msg.response_port = ack_port_;
    last_broadcast_ = now;

    bool sent = send_message(msg);

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    status_.next_message_id = state_.next_message_id;
    status_.next_state = MessageCodec::STATE_CYCLE[state_.current_state_index];
    if (sent) {
        ++status_.messages_sent;
    } else {
        ++status_.send_failures;
    }
    return true;
}

bool SubnetBroadcaster::send_message(const BroadcastMessage& msg) {
    std::string out;
    if (!MessageCodec::encode(msg, out)) {
        qCWarning(lcBroadcaster) << "message" << msg.message_id << "does not fit in a datagram";
        return false;
    }

    ssize_t r = sendto(sockfd_, out.data(), out.size(), 0,
                       reinterpret_cast<struct sockaddr*>(&dest_), sizeof(dest_));
    if (r != static_cast<ssize_t>(out.size())) {
        qCWarning(lcBroadcaster) << "failed to send message" << msg.message_id << ":"
                                 << (r < 0 ? std::strerror(errno) : "short write");
        return false;
    }
    qCDebug(lcBroadcaster) << "sent message" << msg.message_id << MessageCodec::name_for(msg.state).c_str();
    return true;
}

int SubnetBroadcaster::poll_acks(int timeout_ms) {
    std::vector<ReadyEvent> ready;
    if (poller_.wait(timeout_ms, ready) <= 0) return 0;

    int acks = 0;
    for (const ReadyEvent& ev : ready) {
        switch (ev.kind) {
            case SourceKind::AckReceive:
                acks += drain_acks(ev.fd);
                break;
            default:
                break;
        }
    }
    return acks;
}

int SubnetBroadcaster::drain_acks(int fd) {
    char buffer[MessageCodec::MAX_DATAGRAM_SIZE];
    int count = 0;
    while (true) {
        struct sockaddr_in sender{};
        socklen_t sender_len = sizeof(sender);
        ssize_t bytes = recvfrom(fd, buffer, sizeof(buffer), MSG_DONTWAIT,
                                 reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
        if (bytes < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                qCWarning(lcBroadcaster) << "ack recvfrom failed:" << std::strerror(errno);
            }
            break;
        }
        record_ack(sender, std::string(buffer, static_cast<std::size_t>(bytes)));
        ++count;
    }
    return count;
}

void SubnetBroadcaster::record_ack(const struct sockaddr_in& sender, const std::string& text) {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &sender.sin_addr, ip_str, sizeof(ip_str));
    std::string ip = ip_str;
    uint16_t port = ntohs(sender.sin_port);
    std::string key = ip + ":" + std::to_string(port);

    qCDebug(lcBroadcaster) << "ack from" << key.c_str() << ":" << text.c_str();

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ++status_.acks_received;
    auto it = listeners_.find(key);
    if (it == listeners_.end()) {
        qCInfo(lcBroadcaster) << "new listener" << key.c_str();
        ListenerInfo info;
        info.ip = ip;
        info.port = port;
        info.ack_count = 0;
        info.first_seen = MessageCodec::now_iso8601();
        it = listeners_.emplace(key, info).first;
    }
    it->second.last_ack = text;
    ++it->second.ack_count;
    it->second.last_seen = std::chrono::steady_clock::now();
}

std::size_t SubnetBroadcaster::prune_stale(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    std::size_t removed = 0;
    for (auto it = listeners_.begin(); it != listeners_.end(); ) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.last_seen).count();
        if (age > static_cast<long long>(config_.expiry_ms)) {
            qCInfo(lcBroadcaster) << "removing stale listener" << it->first.c_str();
            it = listeners_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::map<std::string, ListenerInfo> SubnetBroadcaster::get_listeners() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_;
}

PublisherStatus SubnetBroadcaster::status() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return status_;
}

void SubnetBroadcaster::run_loop() {
    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        tick(now);
        poll_acks(kAckPollMs);
        prune_stale(now);
    }
}

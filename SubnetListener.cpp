#include "SubnetListener.hpp"
#include "Logging.hpp"
#include <QJsonArray>
#include <QUuid>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// bounded readiness wait; the liveness check runs at least this often
constexpr int kPollTimeoutMs = 50;

std::string client_id_or_random(const std::string& id) {
    if (!id.empty()) return id;
    return QUuid::createUuid().toString(QUuid::WithoutBraces).left(8).toStdString();
}

} // namespace

const char* exit_reason_name(ExitReason reason) {
    switch (reason) {
        case ExitReason::MaxRuntime: return "max_runtime";
        case ExitReason::MaxMessages: return "max_messages";
        case ExitReason::Interrupted: return "interrupted";
        case ExitReason::IdleHook: return "idle_hook";
        case ExitReason::PollFailure: return "poll_failure";
        default: return "none";
    }
}

ListenerSession::ListenerSession(const std::string& client_id, double max_runtime, int64_t max_messages)
    : client_id_(client_id), last_processed_id_(-1), start_time_(std::chrono::steady_clock::now()),
      max_runtime_(max_runtime), max_messages_(max_messages) {}

bool ListenerSession::accept(const BroadcastMessage& msg, const std::string& server_ip, uint16_t server_port) {
    if (msg.message_id <= last_processed_id_) return false;
    last_processed_id_ = msg.message_id;

    ReceivedRecord rec;
    rec.server_ip = server_ip;
    rec.server_port = server_port;
    rec.timestamp = msg.timestamp;
    rec.receive_time = MessageCodec::now_iso8601();
    rec.state = msg.state;
    rec.message_id = msg.message_id;
    rec.state_name = msg.state_name.empty() ? MessageCodec::name_for(msg.state) : msg.state_name;
    received_messages_.push_back(rec);

    tracker_.update(msg.state);
    return true;
}

ExitReason ListenerSession::check_liveness(double elapsed_seconds) const {
    if (max_runtime_ > 0 && elapsed_seconds > max_runtime_) return ExitReason::MaxRuntime;
    if (max_messages_ > 0 && static_cast<int64_t>(received_messages_.size()) >= max_messages_) {
        return ExitReason::MaxMessages;
    }
    return ExitReason::Unset;
}

void ListenerSession::mark_started(std::chrono::steady_clock::time_point now) {
    start_time_ = now;
}

double ListenerSession::elapsed_seconds(std::chrono::steady_clock::time_point now) const {
    return std::chrono::duration<double>(now - start_time_).count();
}

QJsonObject ListenerSummary::to_json() const {
    QJsonArray records;
    for (const ReceivedRecord& r : received_messages) {
        QJsonObject o;
        o.insert(QStringLiteral("server_ip"), QString::fromStdString(r.server_ip));
        o.insert(QStringLiteral("server_port"), static_cast<int>(r.server_port));
        o.insert(QStringLiteral("timestamp"), QString::fromStdString(r.timestamp));
        o.insert(QStringLiteral("receive_time"), QString::fromStdString(r.receive_time));
        o.insert(QStringLiteral("state"),
                 QString::fromStdString(r.state_name.empty() ? MessageCodec::name_for(r.state) : r.state_name));
        o.insert(QStringLiteral("message_id"), QJsonValue(static_cast<qint64>(r.message_id)));
        records.append(o);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("client_id"), QString::fromStdString(client_id));
    obj.insert(QStringLiteral("port"), static_cast<int>(port));
    obj.insert(QStringLiteral("start_time"), QString::fromStdString(start_time));
    obj.insert(QStringLiteral("end_time"), QString::fromStdString(end_time));
    obj.insert(QStringLiteral("runtime_seconds"), runtime_seconds);
    obj.insert(QStringLiteral("messages_received"), static_cast<qint64>(messages_received));
    obj.insert(QStringLiteral("last_processed_id"), QJsonValue(static_cast<qint64>(last_processed_id)));
    obj.insert(QStringLiteral("exit_reason"), QString::fromLatin1(exit_reason_name(exit_reason)));
    obj.insert(QStringLiteral("state_loops"), state_loops);
    obj.insert(QStringLiteral("received_messages"), records);
    return obj;
}

SubnetListener::SubnetListener(const ListenerConfig& config)
    : config_(config),
      session_(client_id_or_random(config.client_id), config.max_runtime, config.max_messages),
      sockfd_(-1), response_sockfd_(-1), port_(0), state_(LoopState::Idle), stop_requested_(false),
      acks_sent_(0) {}

SubnetListener::~SubnetListener() {
    shutdown();
}

bool SubnetListener::init() {
    if (state_.load() != LoopState::Idle) {
        qCWarning(lcListener) << "init() called twice";
        return false;
    }

    sockfd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sockfd_ < 0) {
        qCCritical(lcListener) << "socket failed:" << std::strerror(errno);
        return false;
    }

    int on = 1;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
        qCWarning(lcListener) << "setsockopt SO_REUSEADDR failed:" << std::strerror(errno);
    }
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        qCWarning(lcListener) << "setsockopt SO_BROADCAST failed:" << std::strerror(errno);
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(config_.client_port);
    if (bind(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        qCCritical(lcListener) << "bind port" << config_.client_port << "failed:" << std::strerror(errno);
        shutdown();
        return false;
    }

    struct sockaddr_in actual{};
    socklen_t alen = sizeof(actual);
    if (getsockname(sockfd_, reinterpret_cast<struct sockaddr*>(&actual), &alen) < 0) {
        qCCritical(lcListener) << "getsockname failed:" << std::strerror(errno);
        shutdown();
        return false;
    }
    port_ = ntohs(actual.sin_port);

    int flags = fcntl(sockfd_, F_GETFL, 0);
    if (flags < 0 || fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        qCCritical(lcListener) << "fcntl O_NONBLOCK failed:" << std::strerror(errno);
        shutdown();
        return false;
    }

    response_sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (response_sockfd_ < 0) {
        qCCritical(lcListener) << "response socket failed:" << std::strerror(errno);
        shutdown();
        return false;
    }

    if (!poller_.open() || !poller_.add(sockfd_, SourceKind::BroadcastReceive)) {
        shutdown();
        return false;
    }

    state_.store(LoopState::Running);
    qCInfo(lcListener) << "client" << session_.client_id().c_str() << "listening on port" << port_
                       << "max_runtime" << session_.max_runtime() << "max_messages" << session_.max_messages();
    return true;
}

void SubnetListener::request_stop() {
    stop_requested_.store(true);
}

ListenerSummary SubnetListener::run() {
    ListenerSummary summary;
    summary.client_id = session_.client_id();
    summary.port = port_;
    summary.start_time = MessageCodec::now_iso8601();

    if (state_.load() != LoopState::Running) {
        qCWarning(lcListener) << "run() without a successful init()";
        summary.end_time = summary.start_time;
        return summary;
    }

    auto start = std::chrono::steady_clock::now();
    session_.mark_started(start);

    ExitReason reason = ExitReason::Unset;
    std::size_t event_count = 0;
    std::vector<ReadyEvent> ready;

    while (reason == ExitReason::Unset) {
        double elapsed = session_.elapsed_seconds(std::chrono::steady_clock::now());

        if (stop_requested_.load()) {
            reason = ExitReason::Interrupted;
            break;
        }
        reason = session_.check_liveness(elapsed);
        if (reason != ExitReason::Unset) break;

        int n = poller_.wait(kPollTimeoutMs, ready);
        if (n < 0) {
            reason = ExitReason::PollFailure;
            break;
        }
        event_count += static_cast<std::size_t>(n);

        for (const ReadyEvent& ev : ready) {
            switch (ev.kind) {
                case SourceKind::BroadcastReceive:
                    receive_one(ev.fd);
                    break;
                default:
                    break;
            }
        }

        if (idle_hook_ && !idle_hook_(session_, elapsed, event_count)) {
            reason = ExitReason::IdleHook;
        }
    }

    state_.store(LoopState::Exiting);
    qCInfo(lcListener) << "stopping:" << exit_reason_name(reason);
    shutdown();
    state_.store(LoopState::Stopped);

    summary.end_time = MessageCodec::now_iso8601();
    summary.runtime_seconds = session_.elapsed_seconds(std::chrono::steady_clock::now());
    summary.messages_received = session_.received_messages().size();
    summary.last_processed_id = session_.last_processed_id();
    summary.exit_reason = reason;
    summary.state_loops = session_.tracker().loop_count();
    summary.received_messages = session_.received_messages();

    qCInfo(lcListener) << "client" << summary.client_id.c_str() << "ran" << summary.runtime_seconds
                       << "s, received" << summary.messages_received << "messages";
    return summary;
}

HandleResult SubnetListener::receive_one(int fd) {
    char buffer[MessageCodec::MAX_DATAGRAM_SIZE];
    struct sockaddr_in sender{};
    socklen_t sender_len = sizeof(sender);

    ssize_t bytes = recvfrom(fd, buffer, sizeof(buffer), MSG_DONTWAIT,
                             reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
    if (bytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return HandleResult::NoData;
        qCWarning(lcListener) << "recvfrom failed:" << std::strerror(errno);
        return HandleResult::ReceiveError;
    }
    return handle_datagram(buffer, static_cast<std::size_t>(bytes), sender);
}

HandleResult SubnetListener::handle_datagram(const char* data, std::size_t len, const struct sockaddr_in& sender) {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &sender.sin_addr, ip_str, sizeof(ip_str));
    std::string ip = ip_str;
    uint16_t sender_port = ntohs(sender.sin_port);

    BroadcastMessage msg;
    std::string error;
    if (!MessageCodec::decode(data, len, msg, error)) {
        qCWarning(lcListener) << "dropped datagram from" << ip.c_str() << ":" << error.c_str();
        return HandleResult::DecodeError;
    }

    if (!session_.accept(msg, ip, sender_port)) {
        qCDebug(lcListener) << "duplicate or stale message" << msg.message_id
                            << "(last processed" << session_.last_processed_id() << ")";
        return HandleResult::Duplicate;
    }

    qCInfo(lcListener) << "message" << msg.message_id << msg.state_name.c_str()
                       << "from" << ip.c_str() << "sent" << msg.timestamp.c_str();

    uint16_t ack_port = msg.response_port != 0 ? msg.response_port : sender_port;
    send_ack(ip, ack_port, msg.message_id);
    return HandleResult::Accepted;
}

bool SubnetListener::send_ack(const std::string& ip, uint16_t port, int64_t message_id) {
    if (response_sockfd_ < 0) return false;

    struct sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) return false;

    std::string ack = MessageCodec::make_ack(session_.client_id(), message_id);
    ssize_t r = sendto(response_sockfd_, ack.data(), ack.size(), 0,
                       reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (r != static_cast<ssize_t>(ack.size())) {
        qCWarning(lcListener) << "failed to ack message" << message_id << "to" << ip.c_str() << ":"
                              << (r < 0 ? std::strerror(errno) : "short write");
        return false;
    }
    ++acks_sent_;
    return true;
}

void SubnetListener::shutdown() {
    if (sockfd_ >= 0) poller_.remove(sockfd_);
    poller_.close();
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
    if (response_sockfd_ >= 0) {
        ::close(response_sockfd_);
        response_sockfd_ = -1;
    }
}

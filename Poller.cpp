#include "Poller.hpp"
#include "Logging.hpp"
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <unistd.h>

namespace {
constexpr int kMaxEvents = 8;
}

Poller::Poller() : epfd_(-1) {}

Poller::~Poller() {
    close();
}

bool Poller::open() {
    if (epfd_ >= 0) return true;
    epfd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epfd_ < 0) {
        qCCritical(lcNet) << "epoll_create1 failed:" << std::strerror(errno);
        return false;
    }
    return true;
}

void Poller::close() {
    if (epfd_ < 0) return;
    for (const auto& [fd, kind] : sources_) {
        (void)kind;
        ::epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr);
    }
    sources_.clear();
    ::close(epfd_);
    epfd_ = -1;
}

bool Poller::add(int fd, SourceKind kind) {
    if (epfd_ < 0 || fd < 0) return false;
    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (::epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        qCCritical(lcNet) << "epoll_ctl ADD fd" << fd << "failed:" << std::strerror(errno);
        return false;
    }
    sources_[fd] = kind;
    return true;
}

void Poller::remove(int fd) {
    auto it = sources_.find(fd);
    if (it == sources_.end()) return;
    if (epfd_ >= 0 && ::epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        qCWarning(lcNet) << "epoll_ctl DEL fd" << fd << "failed:" << std::strerror(errno);
    }
    sources_.erase(it);
}

int Poller::wait(int timeout_ms, std::vector<ReadyEvent>& out) {
    out.clear();
    if (epfd_ < 0) return -1;

    struct epoll_event events[kMaxEvents];
    int n = ::epoll_wait(epfd_, events, kMaxEvents, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return 0;
        qCWarning(lcNet) << "epoll_wait failed:" << std::strerror(errno);
        return -1;
    }

    for (int i = 0; i < n; ++i) {
        auto it = sources_.find(events[i].data.fd);
        if (it == sources_.end()) continue;
        out.push_back(ReadyEvent{it->first, it->second, events[i].events});
    }
    return static_cast<int>(out.size());
}

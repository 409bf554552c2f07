#include "troupe/poller.hpp"
#include "troupe/log.hpp"
#include <elio/time/timer.hpp>
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace troupe {

namespace {

constexpr int MAX_EVENTS = 64;
constexpr const char* COMPONENT = "poller";

uint32_t to_epoll(Event interest) {
    uint32_t events = EPOLLET | EPOLLRDHUP;
    switch (interest) {
        case Event::Read: events |= EPOLLIN; break;
        case Event::Write: events |= EPOLLOUT; break;
        case Event::Both: events |= EPOLLIN | EPOLLOUT; break;
    }
    return events;
}

// Hang-ups and errors are reported as Both so the owner reads the EOF or
// hits the socket error on its next I/O call.
Event from_epoll(uint32_t events) {
    if (events & (EPOLLERR | EPOLLHUP)) {
        return Event::Both;
    }
    bool readable = events & (EPOLLIN | EPOLLRDHUP);
    bool writable = events & EPOLLOUT;
    if (readable && writable) return Event::Both;
    return writable ? Event::Write : Event::Read;
}

}  // namespace

const char* event_string(Event e) {
    switch (e) {
        case Event::Read: return "read";
        case Event::Write: return "write";
        case Event::Both: return "read|write";
        default: return "unknown";
    }
}

Poller::Poller(elio::io::io_context& io_ctx, Sink sink)
    : io_ctx_(io_ctx)
    , sink_(std::move(sink))
{}

Poller::~Poller() {
    stop();
    if (wake_fd_ >= 0) ::close(wake_fd_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
}

Status Poller::open() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return Status::from_errno(ErrorCode::RegistrarError, "epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        return Status::from_errno(ErrorCode::RegistrarError, "eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = 0;  // reserved for the wake-up descriptor
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        return Status::from_errno(ErrorCode::RegistrarError, "epoll_ctl(wake)");
    }

    return Status::make_ok();
}

void Poller::start(elio::runtime::scheduler& sched) {
    if (running_.exchange(true)) {
        return;
    }

    std::vector<std::pair<RegistrationId, std::chrono::milliseconds>> intervals;
    {
        std::lock_guard lock(mutex_);
        sched_ = &sched;
        intervals.swap(pending_intervals_);
    }
    for (const auto& [id, period] : intervals) {
        spawn_interval(id, period);
    }

    thread_ = std::thread([this] { poll_loop(); });
}

void Poller::stop() {
    running_ = false;
    if (wake_fd_ >= 0) {
        wake();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::optional<RegistrationId> Poller::register_socket(int fd, Event interest) {
    std::lock_guard lock(mutex_);
    RegistrationId id = next_id_++;

    epoll_event ev{};
    ev.events = to_epoll(interest);
    ev.data.u64 = id;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        TROUPE_LOG_WARN(COMPONENT, "epoll_ctl(ADD) fd=" << fd << " failed: "
                        << std::strerror(errno));
        return std::nullopt;
    }

    fd_ids_[fd] = id;
    return id;
}

Status Poller::reregister(RegistrationId id, int fd, Event interest) {
    epoll_event ev{};
    ev.events = to_epoll(interest);
    ev.data.u64 = id;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        return Status::from_errno(ErrorCode::RegistrarError, "epoll_ctl(MOD)");
    }
    return Status::make_ok();
}

Status Poller::deregister(int fd) {
    {
        std::lock_guard lock(mutex_);
        fd_ids_.erase(fd);
    }
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        return Status::from_errno(ErrorCode::RegistrarError, "epoll_ctl(DEL)");
    }
    return Status::make_ok();
}

std::optional<RegistrationId> Poller::set_interval(std::chrono::milliseconds period) {
    if (period.count() <= 0) {
        return std::nullopt;
    }

    RegistrationId id;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
        if (!sched_) {
            pending_intervals_.emplace_back(id, period);
            return id;
        }
    }
    spawn_interval(id, period);
    return id;
}

size_t Poller::registered_sockets() const {
    std::lock_guard lock(mutex_);
    return fd_ids_.size();
}

void Poller::spawn_interval(RegistrationId id, std::chrono::milliseconds period) {
    auto task = interval_loop(id, period);
    sched_->spawn(task.release());
}

elio::coro::task<void> Poller::interval_loop(RegistrationId id, std::chrono::milliseconds period) {
    while (running_) {
        co_await elio::time::sleep_for(io_ctx_, period);

        if (!running_) break;

        if (!sink_({Notification{id, Event::Read}})) {
            TROUPE_LOG_DEBUG(COMPONENT, "timer " << id << " has no listener, stopping");
            break;
        }
    }
}

void Poller::wake() {
    uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        TROUPE_LOG_WARN(COMPONENT, "wake-up write failed");
    }
}

void Poller::poll_loop() {
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            TROUPE_LOG_ERROR(COMPONENT, Status::from_errno(ErrorCode::RegistrarError,
                                                           "epoll_wait").to_string());
            break;
        }

        std::vector<Notification> batch;
        batch.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            if (events[i].data.u64 == 0) {
                uint64_t drained;
                while (::read(wake_fd_, &drained, sizeof(drained)) > 0) {}
                continue;
            }
            batch.push_back(Notification{events[i].data.u64, from_epoll(events[i].events)});
        }

        if (!batch.empty() && !sink_(std::move(batch))) {
            TROUPE_LOG_DEBUG(COMPONENT, "notification sink closed, stopping");
            break;
        }
    }

    running_ = false;
}

}  // namespace troupe

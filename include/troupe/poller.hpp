#pragma once

#include "troupe/registrar.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace troupe {

// epoll-backed Registrar.
//
// Sockets are registered edge-triggered; consumers read and write until the
// socket would block. The epoll loop runs on its own thread. Interval timers
// are coroutines on the elio scheduler. Both post through the same sink.
class Poller : public Registrar {
public:
    // Receives every batch; returns false once nobody is listening
    using Sink = std::function<bool(std::vector<Notification>)>;

    Poller(elio::io::io_context& io_ctx, Sink sink);
    ~Poller() override;

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    Status open();

    // Start the epoll thread and any timers set so far
    void start(elio::runtime::scheduler& sched);

    // Stop the epoll thread and let timer coroutines finish
    void stop();

    bool is_running() const noexcept { return running_; }

    std::optional<RegistrationId> register_socket(int fd, Event interest) override;
    Status reregister(RegistrationId id, int fd, Event interest) override;
    Status deregister(int fd) override;
    std::optional<RegistrationId> set_interval(std::chrono::milliseconds period) override;

    size_t registered_sockets() const;

private:
    void poll_loop();
    elio::coro::task<void> interval_loop(RegistrationId id, std::chrono::milliseconds period);
    void spawn_interval(RegistrationId id, std::chrono::milliseconds period);
    void wake();

    elio::io::io_context& io_ctx_;
    Sink sink_;

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    RegistrationId next_id_ = 1;
    std::unordered_map<int, RegistrationId> fd_ids_;
    std::vector<std::pair<RegistrationId, std::chrono::milliseconds>> pending_intervals_;
    elio::runtime::scheduler* sched_ = nullptr;
};

}  // namespace troupe

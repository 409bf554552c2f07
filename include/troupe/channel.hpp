#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace troupe {

namespace detail {

// State shared by all senders and the single receiver of a channel
template<typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> queue;
    size_t senders = 0;
    bool receiver_alive = true;
};

}  // namespace detail

template<typename T> class Receiver;

// Producer end. Copies share the channel; the channel disconnects for the
// receiver when the last sender is gone.
template<typename T>
class Sender {
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state))
    {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        ++state_->senders;
    }

    Sender(const Sender& other) : Sender(other.state_) {}

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() { release(); }

    // Enqueue value. Returns false once the receiver has been dropped.
    bool send(T value) const {
        if (!state_) return false;
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->receiver_alive) {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->cv.notify_one();
        return true;
    }

    bool valid() const noexcept { return state_ != nullptr; }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;

    void release() {
        if (!state_) return;
        bool last = false;
        {
            std::lock_guard lock(state_->mutex);
            last = --state_->senders == 0;
        }
        if (last) {
            state_->cv.notify_all();
        }
        state_.reset();
    }
};

// Consumer end. Move-only.
template<typename T>
class Receiver {
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&& other) noexcept = default;

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    // Block until a value arrives. Empty once every sender is gone and the
    // queue is drained.
    std::optional<T> recv() {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    // Like recv(), giving up after timeout
    template<typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    std::optional<T> try_recv() {
        std::lock_guard lock(state_->mutex);
        return pop_locked();
    }

    size_t size() const {
        std::lock_guard lock(state_->mutex);
        return state_->queue.size();
    }

    bool valid() const noexcept { return state_ != nullptr; }

    // Drop the receiving end; later sends fail
    void close() {
        if (!state_) return;
        std::lock_guard lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;

    std::optional<T> pop_locked() {
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }
};

// Create a connected sender/receiver pair
template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace troupe

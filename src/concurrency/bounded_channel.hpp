#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace kvtree::concurrency {

// ── BoundedChannel ───────────────────────────────────────────────────────────
//
// Single-producer / single-consumer queue with a fixed capacity, split into a
// Sender and a Receiver half that share one state block.
//
//   - Sender::send() blocks while the buffer is full and fails once the
//     Receiver has been closed or destroyed.
//   - Receiver::receive() blocks while the buffer is empty and returns
//     std::nullopt once the Sender is closed and everything sent has been
//     drained.  A Sender closed with an error makes receive() rethrow that
//     error after the drain.
//
// Destroying either half closes it, so a producer that dies or a consumer that
// walks away always releases the other side.

namespace detail {

template <typename T>
struct ChannelState {
    explicit ChannelState(std::size_t cap) : capacity(std::max<std::size_t>(cap, 1)) {}

    std::mutex              mutex;
    std::condition_variable not_full;
    std::condition_variable not_empty;
    std::deque<T>           buffer;
    const std::size_t       capacity;
    bool                    sender_closed   = false;
    bool                    receiver_closed = false;
    std::exception_ptr      error;
};

} // namespace detail

template <typename T>
class Sender {
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state))
    {}

    ~Sender() { close(); }

    Sender(Sender&&) noexcept = default;
    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    Sender(const Sender&)            = delete;
    Sender& operator=(const Sender&) = delete;

    // Blocks while the buffer is full.  Returns false, dropping `item`, when
    // the receiving side is gone.
    [[nodiscard]] bool send(T item) {
        if (!state_) {
            return false;
        }
        std::unique_lock lock(state_->mutex);
        state_->not_full.wait(lock, [this] {
            return state_->receiver_closed ||
                   state_->buffer.size() < state_->capacity;
        });
        if (state_->receiver_closed || state_->sender_closed) {
            return false;
        }
        state_->buffer.push_back(std::move(item));
        lock.unlock();
        state_->not_empty.notify_one();
        return true;
    }

    // Marks the end of the stream.  A non-null `error` is rethrown to the
    // receiver after it has drained the buffer.  Idempotent.
    void close(std::exception_ptr error = nullptr) noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->sender_closed) {
                state_->sender_closed = true;
                state_->error = std::move(error);
            }
        }
        state_->not_empty.notify_all();
        state_->not_full.notify_all();
    }

    // True once the receiver has been closed or destroyed.
    [[nodiscard]] bool receiver_closed() const {
        if (!state_) {
            return true;
        }
        std::lock_guard lock(state_->mutex);
        return state_->receiver_closed;
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state))
    {}

    ~Receiver() { close(); }

    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    Receiver(const Receiver&)            = delete;
    Receiver& operator=(const Receiver&) = delete;

    // Blocks until an item is available or the stream has ended.
    // Returns std::nullopt at the end of the stream; rethrows the sender's
    // error (once) if it closed with one.
    std::optional<T> receive() {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock lock(state_->mutex);
        state_->not_empty.wait(lock, [this] {
            return !state_->buffer.empty() || state_->sender_closed ||
                   state_->receiver_closed;
        });
        if (!state_->buffer.empty()) {
            T item = std::move(state_->buffer.front());
            state_->buffer.pop_front();
            lock.unlock();
            state_->not_full.notify_one();
            return item;
        }
        if (state_->error) {
            auto error = std::exchange(state_->error, nullptr);
            std::rethrow_exception(error);
        }
        return std::nullopt;
    }

    // Stops the stream from the consuming side: pending items are dropped and
    // any blocked or future send() fails.  Idempotent.
    void close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            state_->receiver_closed = true;
            state_->buffer.clear();
        }
        state_->not_full.notify_all();
        state_->not_empty.notify_all();
    }

    // Number of items currently buffered.
    [[nodiscard]] std::size_t buffered() const {
        if (!state_) {
            return 0;
        }
        std::lock_guard lock(state_->mutex);
        return state_->buffer.size();
    }

    [[nodiscard]] std::size_t capacity() const {
        return state_ ? state_->capacity : 0;
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Creates a connected Sender/Receiver pair.  A capacity of 0 is treated as 1.
template <typename T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>{state}, Receiver<T>{state}};
}

} // namespace kvtree::concurrency

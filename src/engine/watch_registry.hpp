#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

namespace kvtree {

namespace detail {

// ── WatchState ───────────────────────────────────────────────────────────────
//
// Shared completion state of one watcher.  Owned by its WatchSignal; the
// registry only keeps a weak reference, so an abandoned signal simply expires.

class WatchState {
public:
    enum class Outcome : uint8_t {
        Pending   = 0,
        Fired     = 1,
        Cancelled = 2,
    };

    // Callback invoked exactly once with `true` when fired, `false` when
    // cancelled.  Runs on the thread that completes the state.
    using Callback = std::function<void(bool fired)>;

    // Moves Pending → `outcome` and runs the callbacks.  Returns false if the
    // state had already completed.
    bool complete(Outcome outcome);

    [[nodiscard]] Outcome outcome() const;

    // Blocks until completed; returns true if fired.
    bool wait();

    // Returns true if fired before `deadline`.
    bool wait_until(std::chrono::steady_clock::time_point deadline);

    // Runs `callback` on completion, or right away if already completed.
    void on_complete(Callback callback);

private:
    mutable std::mutex mutex_;
    std::condition_variable done_;
    Outcome outcome_ = Outcome::Pending;
    std::vector<Callback> callbacks_;
};

} // namespace detail

// ── WatchSignal ──────────────────────────────────────────────────────────────
//
// Single-shot notification returned by WatchRegistry::watch().  Completes at
// most once: fired by the first matching write after registration, or
// cancelled by cancel().  Destroying the signal abandons the watch.
//
// Any number of threads may wait on the same signal.

class WatchSignal {
public:
    WatchSignal() = default;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    // True once a matching write has fired the signal.
    [[nodiscard]] bool ready() const;

    // Blocks until the signal completes.  Returns true if it fired, false if
    // it was cancelled (or is not valid).
    bool wait() const;

    // Like wait(), giving up after `timeout`.  Returns true only if fired.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            return false;
        }
        return state_->wait_until(std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

    // Completes the signal as cancelled.  Waiters wake with `false`; a later
    // matching write no longer fires it.  No-op if already completed.
    void cancel();

    // Asynchronous wait with Boost.Asio completion-token support.
    // Completion signature: void(bool fired).  The handler is dispatched
    // through its associated executor, which is kept busy until then.  The
    // signal must outlive the wait; destroying it drops the pending handler.
    //
    //   bool fired = co_await signal.async_wait(boost::asio::use_awaitable);
    template <typename CompletionToken>
    auto async_wait(CompletionToken&& token) const {
        return boost::asio::async_initiate<CompletionToken, void(bool)>(
            [](auto handler, std::shared_ptr<detail::WatchState> state) {
                using Handler  = decltype(handler);
                using Executor = boost::asio::associated_executor_t<Handler>;

                struct Pending {
                    Handler handler;
                    boost::asio::executor_work_guard<Executor> work;
                };

                auto executor = boost::asio::get_associated_executor(handler);
                auto pending = std::make_shared<Pending>(Pending{
                    std::move(handler), boost::asio::make_work_guard(executor)});

                if (!state) {
                    boost::asio::post(executor, [pending]() mutable {
                        std::move(pending->handler)(false);
                        pending->work.reset();
                    });
                    return;
                }

                state->on_complete([pending](bool fired) {
                    auto ex = pending->work.get_executor();
                    boost::asio::post(ex, [pending, fired]() mutable {
                        std::move(pending->handler)(fired);
                        pending->work.reset();
                    });
                });
            },
            token, state_);
    }

private:
    friend class WatchRegistry;
    explicit WatchSignal(std::shared_ptr<detail::WatchState> state)
        : state_(std::move(state))
    {}

    std::shared_ptr<detail::WatchState> state_;
};

// ── WatchRegistry ────────────────────────────────────────────────────────────
//
// Prefix subscriptions of one namespace.
//
//   1. A reader calls watch(prefix) and waits on the returned WatchSignal.
//   2. A writer commits key K and calls wake(K).
//   3. Every pending watcher whose prefix is a byte prefix of K fires and is
//      removed from the registry.
//
// The internal lock covers only registration, pruning and the wake scan;
// signals are completed after the lock is released.  Thread-safe.

class WatchRegistry {
public:
    // Full prune pass after this many registrations.
    static constexpr std::size_t kPruneInterval = 64;

    [[nodiscard]] WatchSignal watch(std::string_view prefix);

    // Fires every watcher whose prefix is a prefix of `key`.
    // Returns the number of signals fired.
    std::size_t wake(std::string_view key);

    // Drops abandoned and cancelled watchers.  Returns how many were dropped.
    std::size_t prune();

    // Registered watchers, including abandoned ones not yet pruned.
    [[nodiscard]] std::size_t pending_count() const;

private:
    using Entry = std::weak_ptr<detail::WatchState>;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Entry>, std::less<>> watchers_;
    std::size_t registrations_ = 0;
};

} // namespace kvtree

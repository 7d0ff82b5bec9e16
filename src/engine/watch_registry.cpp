#include "engine/watch_registry.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace kvtree {

namespace detail {

bool WatchState::complete(Outcome outcome) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (outcome_ != Outcome::Pending) {
            return false;
        }
        outcome_ = outcome;
        callbacks.swap(callbacks_);
    }
    done_.notify_all();

    const bool fired = outcome == Outcome::Fired;
    for (auto& callback : callbacks) {
        callback(fired);
    }
    return true;
}

WatchState::Outcome WatchState::outcome() const {
    std::lock_guard lock(mutex_);
    return outcome_;
}

bool WatchState::wait() {
    std::unique_lock lock(mutex_);
    done_.wait(lock, [this] { return outcome_ != Outcome::Pending; });
    return outcome_ == Outcome::Fired;
}

bool WatchState::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    done_.wait_until(lock, deadline, [this] { return outcome_ != Outcome::Pending; });
    return outcome_ == Outcome::Fired;
}

void WatchState::on_complete(Callback callback) {
    bool fired = false;
    {
        std::lock_guard lock(mutex_);
        if (outcome_ == Outcome::Pending) {
            callbacks_.push_back(std::move(callback));
            return;
        }
        fired = outcome_ == Outcome::Fired;
    }
    callback(fired);
}

} // namespace detail

// ── WatchSignal ───────────────────────────────────────────────────────────────

bool WatchSignal::ready() const {
    return state_ && state_->outcome() == detail::WatchState::Outcome::Fired;
}

bool WatchSignal::wait() const {
    if (!state_) {
        return false;
    }
    return state_->wait();
}

void WatchSignal::cancel() {
    if (state_) {
        state_->complete(detail::WatchState::Outcome::Cancelled);
    }
}

// ── WatchRegistry ─────────────────────────────────────────────────────────────

WatchSignal WatchRegistry::watch(std::string_view prefix) {
    auto state = std::make_shared<detail::WatchState>();

    bool prune_due = false;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(prefix);
        if (it == watchers_.end()) {
            it = watchers_.emplace(std::string(prefix), std::vector<Entry>{}).first;
        }
        auto& entries = it->second;
        std::erase_if(entries, [](const Entry& e) { return e.expired(); });
        entries.push_back(state);
        prune_due = ++registrations_ % kPruneInterval == 0;
    }

    if (prune_due) {
        prune();
    }
    return WatchSignal{std::move(state)};
}

std::size_t WatchRegistry::wake(std::string_view key) {
    std::vector<Entry> triggered;
    {
        std::lock_guard lock(mutex_);
        if (watchers_.empty()) {
            return 0;
        }
        for (std::size_t length = 0; length <= key.size(); ++length) {
            auto it = watchers_.find(key.substr(0, length));
            if (it == watchers_.end()) {
                continue;
            }
            std::move(it->second.begin(), it->second.end(), std::back_inserter(triggered));
            watchers_.erase(it);
        }
    }

    std::size_t fired = 0;
    for (auto& entry : triggered) {
        if (auto state = entry.lock()) {
            if (state->complete(detail::WatchState::Outcome::Fired)) {
                ++fired;
            }
        }
    }
    return fired;
}

std::size_t WatchRegistry::prune() {
    std::lock_guard lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = watchers_.begin(); it != watchers_.end();) {
        dropped += std::erase_if(it->second, [](const Entry& e) {
            auto state = e.lock();
            return !state ||
                   state->outcome() != detail::WatchState::Outcome::Pending;
        });
        if (it->second.empty()) {
            it = watchers_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t WatchRegistry::pending_count() const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, entries] : watchers_) {
        count += entries.size();
    }
    return count;
}

} // namespace kvtree

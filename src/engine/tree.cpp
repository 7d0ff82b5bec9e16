#include "engine/tree.hpp"

#include "storage/counter.hpp"

#include <utility>

namespace kvtree {

Tree::Tree(std::shared_ptr<Engine> engine, std::shared_ptr<NamespaceState> ns)
    : engine_(std::move(engine))
    , ns_(std::move(ns))
{}

// ── Point operations ──────────────────────────────────────────────────────────

std::optional<std::string> Tree::get(std::string_view key) const {
    auto txn = engine_->environment().begin_read();
    return txn.get(ns_->handle, key);
}

void Tree::insert(std::string_view key, std::string_view value) {
    {
        auto txn = engine_->environment().begin_write();
        txn.put(ns_->handle, key, value);
        txn.commit();
    }
    // Writer lock is released; wake never overlaps a write transaction.
    ns_->watchers.wake(key);
}

void Tree::insert_batch(const std::vector<KeyValue>& entries) {
    if (entries.empty()) {
        return;
    }
    {
        auto txn = engine_->environment().begin_write();
        for (const auto& [key, value] : entries) {
            txn.put(ns_->handle, key, value);
        }
        txn.commit();
    }
    for (const auto& [key, _] : entries) {
        ns_->watchers.wake(key);
    }
}

void Tree::remove(std::string_view key) {
    auto txn = engine_->environment().begin_write();
    txn.remove(ns_->handle, key);
    txn.commit();
}

std::size_t Tree::clear() {
    auto txn = engine_->environment().begin_write();
    const auto removed = txn.clear(ns_->handle);
    txn.commit();
    engine_->logger()->debug("Cleared {} keys from '{}'", removed, name());
    return removed;
}

// ── Counters ──────────────────────────────────────────────────────────────────

std::string Tree::increment(std::string_view key) {
    auto txn = engine_->environment().begin_write();
    auto next = storage::next_counter(txn.get(ns_->handle, key));
    txn.put(ns_->handle, key, next);
    txn.commit();
    return next;
}

std::vector<std::string> Tree::increment_batch(const std::vector<std::string>& keys) {
    std::vector<std::string> values;
    values.reserve(keys.size());

    auto txn = engine_->environment().begin_write();
    for (const auto& key : keys) {
        auto next = storage::next_counter(txn.get(ns_->handle, key));
        txn.put(ns_->handle, key, next);
        values.push_back(std::move(next));
    }
    txn.commit();
    return values;
}

// ── Range scans ───────────────────────────────────────────────────────────────

ScanStream Tree::iter() const {
    return start_scan({}, false, std::nullopt);
}

ScanStream Tree::iter_from(std::string_view from, bool backwards) const {
    return start_scan(from, backwards, std::nullopt);
}

ScanStream Tree::scan_prefix(std::string_view prefix) const {
    return start_scan(prefix, false, std::string(prefix));
}

ScanStream Tree::start_scan(std::string_view from, bool backwards,
                            std::optional<std::string> stop_after_prefix) const {
    auto [sender, receiver] = concurrency::make_channel<KeyValue>(
        engine_->config().scan_channel_capacity);
    engine_->submit_scan(ns_, std::string(from), backwards, std::move(sender));
    return ScanStream{std::move(receiver), std::move(stop_after_prefix)};
}

// ── Change notification ───────────────────────────────────────────────────────

WatchSignal Tree::watch_prefix(std::string_view prefix) const {
    return ns_->watchers.watch(prefix);
}

} // namespace kvtree

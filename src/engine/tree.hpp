#pragma once

#include "engine/engine.hpp"
#include "engine/scan_stream.hpp"
#include "engine/watch_registry.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvtree {

// ── Tree ─────────────────────────────────────────────────────────────────────
//
// Handle to one namespace of an Engine.
//
// Point operations run in short-lived transactions on the calling thread.
// Writes serialise on the environment's single writer; reads use snapshots and
// never wait for writers.  Range scans run on the Engine's worker pool and are
// consumed through a ScanStream.
//
// Keys and values are arbitrary bytes held in std::string; keys order
// bytewise.
//
// Thread-safe.  Obtain through Engine::open_tree().

class Tree {
public:
    Tree(std::shared_ptr<Engine> engine, std::shared_ptr<NamespaceState> ns);

    [[nodiscard]] const std::string& name() const noexcept { return ns_->handle.name; }

    // ── Point operations ─────────────────────────────────────────────────────

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Upserts and, once committed, fires watchers whose prefix matches `key`.
    void insert(std::string_view key, std::string_view value);

    // All pairs in one transaction; watchers fire per key after the commit.
    void insert_batch(const std::vector<KeyValue>& entries);

    // No-op for a missing key.  Does not fire watchers.
    void remove(std::string_view key);

    // Removes every key.  Does not fire watchers.  Returns the number removed.
    std::size_t clear();

    // ── Counters ─────────────────────────────────────────────────────────────

    // Atomically adds one to the 8-byte big-endian counter at `key` and
    // returns the new encoded value.  A missing key yields 1.
    std::string increment(std::string_view key);

    // Increments every key in one transaction; returns the new values in
    // input order.  A key listed twice is incremented twice.
    std::vector<std::string> increment_batch(const std::vector<std::string>& keys);

    // ── Range scans ──────────────────────────────────────────────────────────

    // Whole namespace, ascending.
    [[nodiscard]] ScanStream iter() const;

    // Ascending from the first key >= `from` (the whole namespace when `from`
    // is empty), or descending from the last key <= `from` when `backwards`.
    [[nodiscard]] ScanStream iter_from(std::string_view from, bool backwards) const;

    // Every key starting with `prefix`, ascending.
    [[nodiscard]] ScanStream scan_prefix(std::string_view prefix) const;

    // ── Change notification ──────────────────────────────────────────────────

    // Signal fired by the first insert after this call whose key starts with
    // `prefix`.
    [[nodiscard]] WatchSignal watch_prefix(std::string_view prefix) const;

private:
    [[nodiscard]] ScanStream start_scan(std::string_view from, bool backwards,
                                        std::optional<std::string> stop_after_prefix) const;

    std::shared_ptr<Engine> engine_;
    std::shared_ptr<NamespaceState> ns_;
};

} // namespace kvtree

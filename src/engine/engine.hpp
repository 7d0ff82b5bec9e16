#pragma once

#include "common/engine_config.hpp"
#include "concurrency/bounded_channel.hpp"
#include "concurrency/worker_pool.hpp"
#include "engine/scan_stream.hpp"
#include "engine/watch_registry.hpp"
#include "storage/environment.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace kvtree {

class Tree;

// ── NamespaceState ───────────────────────────────────────────────────────────
//
// Per-namespace state shared by every Tree handle opened for the same name
// on one Engine.

struct NamespaceState {
    explicit NamespaceState(storage::NamespaceHandle h) : handle(std::move(h)) {}

    storage::NamespaceHandle handle;
    WatchRegistry watchers;
};

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Open storage environment plus the worker pool shared by all of its trees.
//
// Always held through std::shared_ptr: every Tree, and every background scan
// a Tree starts, keeps the Engine alive, so callers may drop their own
// handles at any time.
//
// Thread safety: all public methods may be called concurrently.

class Engine : public std::enable_shared_from_this<Engine> {
    struct PrivateTag {};

public:
    // Opens (or creates) the database described by `config`.
    // Throws StorageOpenError if it cannot be opened.
    [[nodiscard]] static std::shared_ptr<Engine> open(const EngineConfig& config);

    // Use open().
    Engine(PrivateTag, EngineConfig config);
    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // Returns a handle to the namespace `name`, creating it if needed.
    // Handles for the same name share state.  Throws StorageOpenError.
    [[nodiscard]] std::shared_ptr<Tree> open_tree(const std::string& name);

    // Forces every committed write onto disk.  Blocks; throws StorageIOError.
    void flush();

    [[nodiscard]] std::string memory_usage() const;

    // Every namespace in the environment, in name order.
    [[nodiscard]] std::vector<std::string> tree_names() const;

    [[nodiscard]] const concurrency::WorkerPool& worker_pool() const noexcept { return *pool_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

    [[nodiscard]] storage::Environment& environment() noexcept { return *env_; }

private:
    friend class Tree;

    // Starts a scan job on the pool (or an overflow thread).  Throws
    // TransactionError when no thread can be started for it.
    void submit_scan(std::shared_ptr<NamespaceState> ns, std::string from,
                     bool backwards, concurrency::Sender<KeyValue> sender);

    EngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<storage::Environment> env_;

    mutable std::mutex namespaces_mutex_;
    std::map<std::string, std::shared_ptr<NamespaceState>> namespaces_;

    // Declared last: destroyed (and joined) before the environment closes.
    std::unique_ptr<concurrency::WorkerPool> pool_;
};

} // namespace kvtree

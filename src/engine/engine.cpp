#include "engine/engine.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/tree.hpp"

#include <exception>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace kvtree {

namespace {

// Body of one background scan.  Runs on a pool worker or overflow thread and
// owns the read transaction and cursor for the whole scan.
void run_scan(Engine& engine, const NamespaceState& ns, const std::string& from,
              bool backwards, concurrency::Sender<KeyValue>& sender) {
    feed_scan(sender, *engine.logger(), ns.handle.name,
              [&](concurrency::Sender<KeyValue>& out) {
        auto txn = engine.environment().begin_read();
        auto cursor = backwards
            ? txn.backward_range(ns.handle, from)
            : txn.forward_range(ns.handle, from.empty()
                                               ? std::nullopt
                                               : std::optional<std::string_view>{from});

        for (; cursor.valid(); cursor.next()) {
            KeyValue entry{std::string(cursor.key()), std::string(cursor.value())};
            if (!out.send(std::move(entry))) {
                return false;
            }
        }
        cursor.check();
        return true;
    });
}

} // namespace

// ── Engine ────────────────────────────────────────────────────────────────────

std::shared_ptr<Engine> Engine::open(const EngineConfig& config) {
    return std::make_shared<Engine>(PrivateTag{}, config);
}

Engine::Engine(PrivateTag, EngineConfig config)
    : config_(std::move(config))
    , logger_(make_component_logger("engine", parse_log_level(config_.log_level)))
{
    storage::EnvironmentOptions options;
    options.path           = config_.database_path;
    options.size_cap_bytes = config_.size_cap_bytes;
    options.max_readers    = config_.max_readers;
    options.max_namespaces = config_.max_namespaces;
    options.sync_writes    = config_.sync_writes;

    env_  = std::make_unique<storage::Environment>(std::move(options), logger_);
    pool_ = std::make_unique<concurrency::WorkerPool>(config_.worker_count, logger_);

    logger_->info("Engine ready at {} – {} scan workers, scan buffer {}",
                  config_.database_path, pool_->max_count(),
                  config_.scan_channel_capacity);
}

Engine::~Engine() {
    logger_->debug("Engine at {} shutting down", config_.database_path);
}

std::shared_ptr<Tree> Engine::open_tree(const std::string& name) {
    std::shared_ptr<NamespaceState> state;
    {
        std::lock_guard lock(namespaces_mutex_);
        auto it = namespaces_.find(name);
        if (it == namespaces_.end()) {
            auto handle = env_->open_namespace(name);
            it = namespaces_.emplace(name, std::make_shared<NamespaceState>(std::move(handle))).first;
        }
        state = it->second;
    }
    return std::make_shared<Tree>(shared_from_this(), std::move(state));
}

void Engine::flush() {
    env_->force_sync();
    logger_->debug("Flushed {}", config_.database_path);
}

std::string Engine::memory_usage() const {
    return env_->memory_usage();
}

std::vector<std::string> Engine::tree_names() const {
    return env_->namespace_names();
}

void Engine::submit_scan(std::shared_ptr<NamespaceState> ns, std::string from,
                         bool backwards, concurrency::Sender<KeyValue> sender) {
    // std::function needs a copyable callable; the sender itself is move-only.
    auto shared_sender = std::make_shared<concurrency::Sender<KeyValue>>(std::move(sender));

    try {
        pool_->execute([self = shared_from_this(), ns = std::move(ns),
                        from = std::move(from), backwards, shared_sender]() {
            run_scan(*self, *ns, from, backwards, *shared_sender);
        });
    } catch (const std::system_error& e) {
        throw TransactionError(std::string("cannot start scan: ") + e.what());
    }
}

} // namespace kvtree

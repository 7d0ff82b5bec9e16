#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace kvtree::concurrency {

// ── WorkerPool ───────────────────────────────────────────────────────────────
//
// Fixed set of reusable worker threads for long-running background jobs
// (range scans).  execute() never queues a job behind a saturated pool: when
// every worker is busy the job gets its own ephemeral thread instead, so the
// pool bounds steady-state thread usage without ever delaying a caller.
//
// Accounting: a job counts as active from the moment execute() accepts it for
// the pool until it returns.  Overflow jobs are tracked separately and never
// count against max_count().
//
// Only std::exception-derived failures escaping a job are logged and dropped.
// Anything else reaches std::terminate, as it would on a plain std::thread.
//
// The pool may be destroyed from inside one of its own jobs (when the job
// held the last reference to the pool's owner); that worker is detached
// instead of joined and exits as soon as its job returns.

class WorkerPool {
public:
    using Job = std::function<void()>;

    // Starts `job` on a new detached thread.  Throws std::system_error when
    // no thread can be created.
    using Spawner = std::function<void(Job job)>;

    enum class Placement : uint8_t {
        Pooled   = 0,
        Overflow = 1,
    };

    // An empty `spawner` launches overflow jobs on std::thread.
    explicit WorkerPool(std::size_t max_workers,
                        std::shared_ptr<spdlog::logger> logger = {},
                        Spawner spawner = {});

    // Stops accepting jobs, lets running jobs finish and joins the workers.
    // Overflow threads are detached and are not waited for.
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&)                 = delete;
    WorkerPool& operator=(WorkerPool&&)      = delete;

    // Runs `job` on a pooled worker if one is free, otherwise on a new
    // detached thread.  Rethrows the std::system_error of a failed thread
    // launch with the pool's counts left untouched.
    Placement execute(Job job);

    // Jobs accepted by the pool and not yet finished.
    [[nodiscard]] std::size_t active_count() const;

    // Overflow jobs still running.
    [[nodiscard]] std::size_t overflow_count() const;

    [[nodiscard]] std::size_t max_count() const noexcept { return max_workers_; }

private:
    struct Shared {
        std::mutex              mutex;
        std::condition_variable work_ready;
        std::deque<Job>         queue;
        std::size_t             active   = 0;
        std::size_t             overflow = 0;
        bool                    stopping = false;
        std::shared_ptr<spdlog::logger> logger;
    };

    static void worker_loop(std::shared_ptr<Shared> shared);
    static void run_job(const Job& job, const std::shared_ptr<Shared>& shared);

    const std::size_t max_workers_;
    Spawner spawn_;
    std::shared_ptr<Shared> shared_;
    std::vector<std::thread> workers_;
};

} // namespace kvtree::concurrency

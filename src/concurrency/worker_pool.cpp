#include "concurrency/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace kvtree::concurrency {

namespace {

void spawn_detached(WorkerPool::Job job) {
    std::thread(std::move(job)).detach();
}

} // namespace

WorkerPool::WorkerPool(std::size_t max_workers, std::shared_ptr<spdlog::logger> logger,
                       Spawner spawner)
    : max_workers_(std::max<std::size_t>(max_workers, 1))
    , spawn_(spawner ? std::move(spawner) : Spawner{&spawn_detached})
    , shared_(std::make_shared<Shared>())
{
    shared_->logger = std::move(logger);
    workers_.reserve(max_workers_);
    for (std::size_t i = 0; i < max_workers_; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, shared_);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(shared_->mutex);
        shared_->stopping = true;
    }
    shared_->work_ready.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == self) {
            // Destroyed from inside our own job; the worker only touches
            // `Shared` from here on, which it co-owns.
            worker.detach();
        } else {
            worker.join();
        }
    }
}

WorkerPool::Placement WorkerPool::execute(Job job) {
    {
        std::unique_lock lock(shared_->mutex);
        if (!shared_->stopping && shared_->active < max_workers_) {
            ++shared_->active;
            shared_->queue.push_back(std::move(job));
            lock.unlock();
            shared_->work_ready.notify_one();
            return Placement::Pooled;
        }
        ++shared_->overflow;
    }

    if (shared_->logger) {
        shared_->logger->debug("Worker pool saturated ({} active), spawning overflow thread",
                               max_workers_);
    }

    try {
        spawn_([job = std::move(job), shared = shared_]() {
            run_job(job, shared);
            std::lock_guard lock(shared->mutex);
            --shared->overflow;
        });
    } catch (const std::system_error& e) {
        {
            std::lock_guard lock(shared_->mutex);
            --shared_->overflow;
        }
        if (shared_->logger) {
            shared_->logger->error("Could not start overflow thread: {}", e.what());
        }
        throw;
    }
    return Placement::Overflow;
}

std::size_t WorkerPool::active_count() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->active;
}

std::size_t WorkerPool::overflow_count() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->overflow;
}

void WorkerPool::worker_loop(std::shared_ptr<Shared> shared) {
    while (true) {
        Job job;
        {
            std::unique_lock lock(shared->mutex);
            shared->work_ready.wait(lock, [&] {
                return shared->stopping || !shared->queue.empty();
            });
            if (shared->queue.empty()) {
                return; // stopping and nothing left to run
            }
            job = std::move(shared->queue.front());
            shared->queue.pop_front();
        }

        run_job(job, shared);

        // Release whatever the job captured before it is reported finished.
        job = nullptr;

        std::lock_guard lock(shared->mutex);
        --shared->active;
    }
}

void WorkerPool::run_job(const Job& job, const std::shared_ptr<Shared>& shared) {
    try {
        job();
    } catch (const std::exception& e) {
        if (shared->logger) {
            shared->logger->error("Background job failed: {}", e.what());
        }
    }
}

} // namespace kvtree::concurrency

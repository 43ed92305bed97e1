#include "runtime/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace lazybar::runtime {

using util::Logger;

WorkerPool& WorkerPool::instance() {
    static WorkerPool pool;
    return pool;
}

WorkerPool::WorkerPool(size_t max_threads) {
    size_t num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) num_threads = 2;
    num_threads = std::min(num_threads, std::max<size_t>(max_threads, 1));

    Logger::info(std::format("WorkerPool: Starting {} worker threads", num_threads));

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_thread(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::submit_job(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (stopping_) {
            Logger::debug("WorkerPool: Stopped, rejecting job");
            return false;
        }
        if (job_queue_.size() >= MAX_QUEUE_SIZE) {
            Logger::warn(std::format("WorkerPool: Queue full ({} jobs), rejecting job", job_queue_.size()));
            return false;
        }

        job_queue_.push(std::move(job));
    }

    cv_.notify_one();
    return true;
}

bool WorkerPool::stop(std::chrono::milliseconds grace) {
    std::queue<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        dropped.swap(job_queue_);
    }
    cv_.notify_all();

    if (!dropped.empty()) {
        Logger::info(std::format("WorkerPool: Dropping {} queued jobs", dropped.size()));
        // Captured state (IPC connections, channels) is released here, outside the lock
        std::queue<Job>().swap(dropped);
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (idle_cv_.wait_for(lock, grace, [this]() { return running_ == 0; })) {
        return true;
    }
    Logger::warn(std::format("WorkerPool: {} jobs still running after {} ms", running_, grace.count()));
    return false;
}

size_t WorkerPool::get_queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

size_t WorkerPool::get_running_jobs() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return running_;
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !job_queue_.empty(); });

            // stop() empties the queue; the destructor lets it drain
            if (job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++running_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            Logger::error(std::string("WorkerPool: Job threw: ") + e.what());
        }
        job = nullptr;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace lazybar::runtime

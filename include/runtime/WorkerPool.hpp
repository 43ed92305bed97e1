#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lazybar::runtime {

// Small fixed pool for blocking work (command execution, IPC replies,
// panel bring-up). Results travel back to the event loop through channels.
class WorkerPool {
public:
    using Job = std::function<void()>;

    static WorkerPool& instance();

    explicit WorkerPool(size_t max_threads = MAX_THREADS);
    // Runs what is still queued, then joins every worker.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Non-blocking. Returns false if the queue is full or the pool is stopped.
    [[nodiscard]] bool submit_job(Job job);

    /**
     * Refuses new jobs, drops the queued ones and waits up to `grace` for
     * running jobs to return. Returns false when a job is still running
     * after that; its worker stays blocked and cannot be joined, so the
     * caller has to end the process with _exit().
     */
    [[nodiscard]] bool stop(std::chrono::milliseconds grace);

    [[nodiscard]] size_t get_queue_size() const;
    [[nodiscard]] size_t get_running_jobs() const;
    [[nodiscard]] size_t get_thread_count() const { return workers_.size(); }

    static constexpr size_t MAX_THREADS = 4;
    static constexpr size_t MAX_QUEUE_SIZE = 64;

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    // Signalled whenever a job returns
    std::condition_variable idle_cv_;

    size_t running_ = 0;
    bool stopping_ = false;
};

} // namespace lazybar::runtime

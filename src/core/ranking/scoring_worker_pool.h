#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace st {

// Fixed-size pool of persistent threads shared by concurrent rank requests.
// Requests submit a batch of independent tasks and block until the batch is
// done; tasks from different requests interleave on the same workers.
class ScoringWorkerPool {
public:
    explicit ScoringWorkerPool(int workerCount);
    ~ScoringWorkerPool();

    // Non-copyable, non-movable
    ScoringWorkerPool(const ScoringWorkerPool&) = delete;
    ScoringWorkerPool& operator=(const ScoringWorkerPool&) = delete;
    ScoringWorkerPool(ScoringWorkerPool&&) = delete;
    ScoringWorkerPool& operator=(ScoringWorkerPool&&) = delete;

    int workerCount() const { return static_cast<int>(m_workers.size()); }

    // Runs task(0) .. task(taskCount - 1) and returns once all have finished.
    // With no workers (or after shutdown) the tasks run on the calling thread.
    void run(std::size_t taskCount, const std::function<void(std::size_t)>& task);

    // Drains queued jobs, then joins the workers. Idempotent.
    void shutdown();

private:
    struct Batch {
        std::mutex mutex;
        std::condition_variable done;
        std::size_t remaining = 0;
    };

    void workerLoop();

    std::vector<std::thread> m_workers;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_jobs;
    bool m_stopping = false;
};

} // namespace st

#include "core/ranking/scoring_worker_pool.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <memory>

namespace st {

ScoringWorkerPool::ScoringWorkerPool(int workerCount)
{
    const int count = std::max(0, workerCount);
    m_workers.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back(&ScoringWorkerPool::workerLoop, this);
    }
    LOG_DEBUG(stRanking, "Scoring pool started with %d workers", count);
}

ScoringWorkerPool::~ScoringWorkerPool()
{
    shutdown();
}

void ScoringWorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_workers.empty()) {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void ScoringWorkerPool::run(std::size_t taskCount, const std::function<void(std::size_t)>& task)
{
    if (taskCount == 0) {
        return;
    }

    auto batch = std::make_shared<Batch>();
    batch->remaining = taskCount;

    bool runInline = taskCount == 1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        runInline = runInline || m_stopping || m_workers.empty();
        if (!runInline) {
            for (std::size_t i = 0; i < taskCount; ++i) {
                m_jobs.emplace_back([batch, &task, i]() {
                    task(i);
                    std::lock_guard<std::mutex> batchLock(batch->mutex);
                    if (--batch->remaining == 0) {
                        batch->done.notify_all();
                    }
                });
            }
        }
    }
    if (runInline) {
        for (std::size_t i = 0; i < taskCount; ++i) {
            task(i);
        }
        return;
    }
    m_cv.notify_all();

    std::unique_lock<std::mutex> batchLock(batch->mutex);
    batch->done.wait(batchLock, [&batch]() { return batch->remaining == 0; });
}

void ScoringWorkerPool::workerLoop()
{
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || !m_jobs.empty(); });
            if (m_jobs.empty()) {
                return;  // stopping and drained
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }
        job();
    }
}

} // namespace st

#include "engine/ThreadPool.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace delve {

ThreadPool::ThreadPool(std::size_t threadCount) {
    std::size_t count = threadCount;
    if (count == 0) {
        count = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }

    m_workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        m_workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    LOG_DEBUG("ThreadPool: started {} workers", count);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return;
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });

            // Drain the queue before honouring the stop request
            if (m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        task();
    }
}

} // namespace delve

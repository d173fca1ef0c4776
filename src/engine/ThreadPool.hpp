#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace delve {

/// Fixed-size worker pool used for the AI decision phase.
/// Workers pull tasks from a shared FIFO queue. The destructor drains
/// pending tasks and joins all workers.
class ThreadPool {
public:
    /// @param threadCount Number of workers; 0 means hardware_concurrency().
    explicit ThreadPool(std::size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable and return a future for its result. After
    /// shutdown() the callable runs on the calling thread instead.
    template<typename Func>
    std::future<std::invoke_result_t<Func>> submit(Func&& func) {
        using ReturnType = std::invoke_result_t<Func>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<Func>(func));
        std::future<ReturnType> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_stopping) {
                m_tasks.emplace_back([task]() { (*task)(); });
                task.reset();
            }
        }
        if (task) {
            (*task)();
            return future;
        }
        m_cv.notify_one();
        return future;
    }

    /// Stop accepting work, finish queued tasks and join the workers.
    void shutdown();

    std::size_t threadCount() const { return m_workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_tasks;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping = false;
};

} // namespace delve

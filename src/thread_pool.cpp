#include "thread_pool.hpp"

namespace binexp {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

// Оставшиеся в очереди задачи дорабатываются до выхода потоков
ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }
    taskAvailable.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this]() { return tasks.empty() && activeTasks == 0; });
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskAvailable.wait(lock, [this]() { return stop || !tasks.empty(); });

            if (stop && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
            ++activeTasks;
        }

        // packaged_task сам перехватывает исключения задачи
        task();

        {
            std::lock_guard<std::mutex> lock(mutex);
            --activeTasks;
            if (tasks.empty() && activeTasks == 0) {
                idle.notify_all();
            }
        }
    }
}

} // namespace binexp

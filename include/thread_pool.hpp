#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace binexp {

// Пул потоков фиксированного размера для параллельного упрощения выражений.
// Каждое дерево независимо, поэтому задачи не требуют координации между собой.
class ThreadPool {
public:
    // При threadCount == 0 создаётся один поток
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь и возвращает future с её результатом.
    // Исключение задачи передаётся через future.
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    // Блокирует вызывающий поток, пока очередь не опустеет
    // и все начатые задачи не завершатся
    void waitIdle();

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;
    std::condition_variable taskAvailable; // Появилась задача или пора остановиться
    std::condition_variable idle;          // Все задачи выполнены
    std::size_t activeTasks = 0;           // Задачи, выполняемые прямо сейчас
    bool stop = false;

    void workerLoop();
};

template <class Func, class... Args>
inline auto ThreadPool::enqueue(Func&& func, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>> {
    using Return = std::invoke_result_t<Func, Args...>;

    auto task = std::make_shared<std::packaged_task<Return()>>(
        std::bind(std::forward<Func>(func), std::forward<Args>(args)...));

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    taskAvailable.notify_one();
    return result;
}

} // namespace binexp

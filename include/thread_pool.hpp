#pragma once

#include <condition_variable>
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

namespace ratcalc {

// Фиксированный пул рабочих потоков для пакетного вычисления строк.
// Все потоки разделяют один PrimeCache, поэтому пул заодно
// нагружает кэш конкурентными обращениями.
class ThreadPool {
public:
    // 0 потоков означает "по числу ядер" (минимум один поток)
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь и возвращает future с её результатом.
    // Исключение из задачи передаётся через future.
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;                  // Защищает tasks и stopping
    std::condition_variable available; // Появилась задача или пул останавливается
    bool stopping = false;

    void workerLoop();
    void shutdown();
};

template <class Func, class... Args>
inline auto ThreadPool::enqueue(Func&& func, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>> {
    using Result = std::invoke_result_t<Func, Args...>;

    auto task = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<Func>(func), std::forward<Args>(args)...));
    std::future<Result> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }
    available.notify_one();
    return result;
}

} // namespace ratcalc

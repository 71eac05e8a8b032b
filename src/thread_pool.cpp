#include "thread_pool.hpp"

namespace ratcalc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
    }
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    try {
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back([this]() { workerLoop(); });
        }
    }
    catch (...) {
        // Деструктор не вызовется: уже запущенные потоки нужно остановить здесь
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// Оставшиеся в очереди задачи дорабатываются до выхода
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    available.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            available.wait(lock, [this]() { return stopping || !tasks.empty(); });
            if (tasks.empty()) {
                return; // stopping и очередь пуста
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

} // namespace ratcalc

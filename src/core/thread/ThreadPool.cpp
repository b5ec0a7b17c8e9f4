#include "core/thread/ThreadPool.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace cachepilot {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskCv;     // Новая задача / остановка
    std::condition_variable notFullCv;  // Освободилось место в очереди
    std::condition_variable idleCv;     // Очередь пуста и никто не работает
    bool stopping = false;
    size_t active = 0;
    size_t completed = 0;
    size_t failed = 0;
    std::shared_ptr<spdlog::logger> logger = common::getLogger("threadpool");

    void start() {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = false;
        for (size_t i = 0; i < config.minThreads; ++i) {
            workers.emplace_back([this]() { workerLoop(); });
        }
        logger->info("ThreadPool: запущено {} потоков (max {})", config.minThreads, config.maxThreads);
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (workers.empty()) {
                return;
            }
            stopping = true;
        }
        taskCv.notify_all();
        notFullCv.notify_all();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        std::lock_guard<std::mutex> lock(mutex);
        workers.clear();
        logger->info("ThreadPool: остановлен, выполнено задач {}", completed);
    }

    // Рабочий цикл: выходит, когда пул остановлен и очередь пуста
    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                taskCv.wait(lock, [this]() { return stopping || !tasks.empty(); });
                if (tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop();
                ++active;
            }
            notFullCv.notify_one();

            bool ok = true;
            try {
                task();
            } catch (const std::exception& e) {
                ok = false;
                logger->error("ThreadPool: задача завершилась исключением: {}", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                --active;
                if (ok) {
                    ++completed;
                } else {
                    ++failed;
                }
                if (tasks.empty() && active == 0) {
                    idleCv.notify_all();
                }
            }
        }
    }

    // Под mutex: добавить поток, если очередь длиннее числа свободных потоков
    void growIfNeeded() {
        size_t idle = workers.size() - std::min(workers.size(), active);
        if (tasks.size() > idle && workers.size() < config.maxThreads) {
            workers.emplace_back([this]() { workerLoop(); });
            logger->debug("ThreadPool: добавлен поток, всего {}", workers.size());
        }
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_unique<Impl>()) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: некорректная конфигурация");
    }
    pImpl->config = config;
    pImpl->start();
}

ThreadPool::~ThreadPool() {
    pImpl->shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        pImpl->notFullCv.wait(lock, [this]() {
            return pImpl->stopping || pImpl->tasks.size() < pImpl->config.queueSize;
        });
        if (pImpl->stopping || pImpl->workers.empty()) {
            return false;
        }
        pImpl->tasks.push(std::move(task));
        pImpl->growIfNeeded();
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->active;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    return getQueueSize() == 0;
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->idleCv.wait(lock, [this]() {
        return pImpl->tasks.empty() && pImpl->active == 0;
    });
}

void ThreadPool::stop() {
    pImpl->shutdown();
}

void ThreadPool::restart() {
    pImpl->shutdown();
    pImpl->start();
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->active;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completed;
    metrics.failedTasks = pImpl->failed;
    return metrics;
}

void ThreadPool::setConfiguration(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: некорректная конфигурация");
    }
    pImpl->shutdown();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->config = config;
    }
    pImpl->start();
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace cachepilot

#include "core/thread/Scheduler.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace cachepilot {
namespace core {
namespace thread {

namespace {
using SteadyClock = std::chrono::steady_clock;
}

struct Scheduler::Impl {
    struct Task {
        SteadyClock::time_point due;
        int64_t intervalMs = 0; // 0 = однократная
        std::function<void()> fn;
        std::string name;
    };

    std::map<TaskId, Task> tasks;
    TaskId nextId = 1;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable idle; // сигнал об окончании текущей задачи
    TaskId runningId = 0;         // 0 = ничего не выполняется
    std::thread worker;
    bool running = false;
    std::shared_ptr<spdlog::logger> logger = common::getLogger("scheduler");

    void loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (running) {
            if (tasks.empty()) {
                cv.wait(lock);
                continue;
            }
            auto next = tasks.begin();
            for (auto it = tasks.begin(); it != tasks.end(); ++it) {
                if (it->second.due < next->second.due) {
                    next = it;
                }
            }
            if (SteadyClock::now() < next->second.due) {
                cv.wait_until(lock, next->second.due);
                continue;
            }

            TaskId id = next->first;
            auto fn = next->second.fn;
            std::string name = next->second.name;
            int64_t interval = next->second.intervalMs;
            if (interval > 0) {
                next->second.due = SteadyClock::now() + std::chrono::milliseconds(interval);
            } else {
                tasks.erase(next);
            }

            runningId = id;
            lock.unlock();
            try {
                fn();
            } catch (const std::exception& e) {
                logger->error("Scheduler: задача '{}' завершилась исключением: {}", name, e.what());
            } catch (...) {
                logger->error("Scheduler: задача '{}' завершилась неизвестным исключением", name);
            }
            lock.lock();
            runningId = 0;
            idle.notify_all();
        }
    }

    // Ждёт окончания задачи id, если она сейчас выполняется. Из самой задачи не ждёт
    void waitIdle(std::unique_lock<std::mutex>& lock, TaskId id) {
        if (std::this_thread::get_id() == worker.get_id()) {
            return;
        }
        idle.wait(lock, [this, id]() { return runningId == 0 || (id != 0 && runningId != id); });
    }
};

Scheduler::Scheduler() : pImpl(std::make_unique<Impl>()) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->running) {
        return;
    }
    pImpl->running = true;
    pImpl->worker = std::thread([this]() { pImpl->loop(); });
    pImpl->logger->info("Scheduler: запущен, задач в очереди {}", pImpl->tasks.size());
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->running) {
            return;
        }
        pImpl->running = false;
    }
    pImpl->cv.notify_all();
    if (pImpl->worker.joinable()) {
        pImpl->worker.join();
    }
    pImpl->logger->info("Scheduler: остановлен");
}

bool Scheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->running;
}

Scheduler::TaskId Scheduler::scheduleOnce(int64_t delayMs, std::function<void()> task, const std::string& name) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        id = pImpl->nextId++;
        pImpl->tasks[id] = Impl::Task{
            SteadyClock::now() + std::chrono::milliseconds(std::max<int64_t>(delayMs, 0)),
            0, std::move(task), name};
    }
    pImpl->cv.notify_all();
    return id;
}

Scheduler::TaskId Scheduler::scheduleEvery(int64_t intervalMs, std::function<void()> task, const std::string& name) {
    TaskId id;
    int64_t interval = std::max<int64_t>(intervalMs, 1);
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        id = pImpl->nextId++;
        pImpl->tasks[id] = Impl::Task{
            SteadyClock::now() + std::chrono::milliseconds(interval),
            interval, std::move(task), name};
    }
    pImpl->cv.notify_all();
    pImpl->logger->debug("Scheduler: '{}' каждые {} мс (id={})", name, interval, id);
    return id;
}

bool Scheduler::cancel(TaskId id) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    bool removed = pImpl->tasks.erase(id) > 0;
    bool running = pImpl->runningId == id;
    pImpl->cv.notify_all();
    pImpl->waitIdle(lock, id);
    return removed || running;
}

void Scheduler::cancelAll() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->tasks.clear();
    pImpl->cv.notify_all();
    pImpl->waitIdle(lock, 0);
}

size_t Scheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

} // namespace thread
} // namespace core
} // namespace cachepilot

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/thread/ThreadPool.hpp"

using cachepilot::core::thread::ThreadPool;
using cachepilot::core::thread::ThreadPoolConfig;

void smokeTestThreadPool() {
    std::cout << "Testing ThreadPool basic operations...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 8;
    config.queueSize = 100;

    ThreadPool pool(config);

    // Начальное состояние
    assert(pool.getActiveThreadCount() == 0);
    assert(pool.getQueueSize() == 0);
    assert(pool.isQueueEmpty());
    assert(pool.getMetrics().totalThreads == 2);

    std::cout << "[OK] ThreadPool smoke test\n";
}

void testThreadPoolTaskExecution() {
    std::cout << "Testing ThreadPool task execution...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 50;

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    for (int i = 0; i < 5; ++i) {
        assert(pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }));
    }

    pool.waitForCompletion();
    assert(taskCounter == 5);
    assert(pool.isQueueEmpty());

    std::cout << "[OK] ThreadPool task execution test\n";
}

void testThreadPoolFailedTasks() {
    std::cout << "Testing ThreadPool failing tasks...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 2;
    config.queueSize = 10;

    ThreadPool pool(config);

    // Исключение задачи не роняет рабочий поток
    pool.enqueue([]() { throw std::runtime_error("boom"); });
    std::atomic<int> after{0};
    pool.enqueue([&after]() { after++; });
    pool.waitForCompletion();

    auto metrics = pool.getMetrics();
    assert(after == 1);
    assert(metrics.failedTasks == 1);
    assert(metrics.completedTasks == 1);

    std::cout << "[OK] ThreadPool failing tasks test\n";
}

void testThreadPoolMetrics() {
    std::cout << "Testing ThreadPool metrics collection...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 20;

    ThreadPool pool(config);

    auto initialMetrics = pool.getMetrics();
    assert(initialMetrics.totalThreads >= config.minThreads);
    assert(initialMetrics.totalThreads <= config.maxThreads);

    std::atomic<int> completedTasks{0};
    for (int i = 0; i < 12; ++i) {
        pool.enqueue([&completedTasks]() {
            completedTasks++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        });
    }

    // Длинная очередь добавляет потоки, но не больше maxThreads
    auto updatedMetrics = pool.getMetrics();
    assert(updatedMetrics.totalThreads >= config.minThreads);
    assert(updatedMetrics.totalThreads <= config.maxThreads);

    pool.waitForCompletion();
    assert(completedTasks == 12);
    assert(pool.getMetrics().completedTasks == 12);

    std::cout << "[OK] ThreadPool metrics test\n";
}

void testThreadPoolConfiguration() {
    std::cout << "Testing ThreadPool configuration management...\n";

    ThreadPoolConfig initialConfig;
    initialConfig.minThreads = 2;
    initialConfig.maxThreads = 4;
    initialConfig.queueSize = 50;

    ThreadPool pool(initialConfig);

    auto currentConfig = pool.getConfiguration();
    assert(currentConfig.minThreads == 2);
    assert(currentConfig.maxThreads == 4);
    assert(currentConfig.queueSize == 50);

    ThreadPoolConfig newConfig;
    newConfig.minThreads = 3;
    newConfig.maxThreads = 6;
    newConfig.queueSize = 100;
    pool.setConfiguration(newConfig);

    auto updatedConfig = pool.getConfiguration();
    assert(updatedConfig.minThreads == 3);
    assert(updatedConfig.maxThreads == 6);
    assert(updatedConfig.queueSize == 100);
    assert(pool.getMetrics().totalThreads == 3);

    // Некорректный конфиг отклоняется
    ThreadPoolConfig broken;
    broken.minThreads = 5;
    broken.maxThreads = 2;
    bool thrown = false;
    try {
        pool.setConfiguration(broken);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    assert(pool.getConfiguration().minThreads == 3);

    std::cout << "[OK] ThreadPool configuration test\n";
}

void testThreadPoolStopRestart() {
    std::cout << "Testing ThreadPool stop/restart operations...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 20;

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    for (int i = 0; i < 3; ++i) {
        pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        });
    }

    // stop дожидается очереди
    pool.stop();
    assert(taskCounter == 3);
    assert(!pool.enqueue([&taskCounter]() { taskCounter++; }));

    pool.restart();
    for (int i = 0; i < 2; ++i) {
        assert(pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }));
    }

    pool.waitForCompletion();
    assert(taskCounter == 5);

    std::cout << "[OK] ThreadPool stop/restart test\n";
}

void testThreadPoolConcurrentAccess() {
    std::cout << "Testing ThreadPool concurrent access...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 16; // меньше числа задач: enqueue блокируется

    ThreadPool pool(config);

    std::atomic<int> taskCounter{0};
    const int numThreads = 4;
    const int tasksPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&pool, &taskCounter, tasksPerThread]() {
            for (int i = 0; i < tasksPerThread; ++i) {
                pool.enqueue([&taskCounter]() {
                    taskCounter++;
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    pool.waitForCompletion();
    assert(taskCounter == numThreads * tasksPerThread);

    std::cout << "[OK] ThreadPool concurrent access test\n";
}

int main() {
    try {
        smokeTestThreadPool();
        testThreadPoolTaskExecution();
        testThreadPoolFailedTasks();
        testThreadPoolMetrics();
        testThreadPoolConfiguration();
        testThreadPoolStopRestart();
        testThreadPoolConcurrentAccess();
        std::cout << "All ThreadPool tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ThreadPool test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

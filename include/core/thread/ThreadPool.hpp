#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>

namespace cachepilot {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;    // Занятые потоки
    size_t queueSize = 0;        // Размер очереди
    size_t totalThreads = 0;     // Всего потоков
    size_t completedTasks = 0;   // Выполнено задач
    size_t failedTasks = 0;      // Задачи, завершившиеся исключением
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 2;          // Мин. потоки
    size_t maxThreads = 4;          // Макс. потоки
    size_t queueSize = 1000;        // Макс. очередь

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков. Создаёт minThreads рабочих, при длинной очереди
// добавляет потоки до maxThreads. enqueue блокируется при полной очереди.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    bool enqueue(std::function<void()> task); // Добавить задачу (false после stop)
    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул
    void restart(); // Перезапустить пул
    ThreadPoolMetrics getMetrics() const; // Метрики
    void setConfiguration(const ThreadPoolConfig& config); // Установить конфиг
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace cachepilot

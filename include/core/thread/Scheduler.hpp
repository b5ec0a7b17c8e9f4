#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cachepilot {
namespace core {
namespace thread {

// Scheduler — таймеры на одном рабочем потоке.
// Все задачи выполняются последовательно, исключения логируются.
class Scheduler {
public:
    using TaskId = uint64_t;
    Scheduler(); // Конструктор
    ~Scheduler(); // Деструктор (останавливает поток)
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start(); // Запустить поток
    void stop();  // Остановить поток, задачи остаются в очереди
    bool isRunning() const;

    TaskId scheduleOnce(int64_t delayMs, std::function<void()> task, const std::string& name = "once");
    TaskId scheduleEvery(int64_t intervalMs, std::function<void()> task, const std::string& name = "periodic");
    // Если задача уже выполняется, ждёт её окончания (кроме вызова из самой задачи).
    // После возврата колбэк задачи больше не запускается
    bool cancel(TaskId id); // false, если задачи нет
    void cancelAll(); // Тоже дожидается текущей задачи
    size_t pendingCount() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace cachepilot

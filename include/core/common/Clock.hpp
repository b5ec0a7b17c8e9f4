#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace cachepilot {
namespace core {
namespace common {

// Clock — источник времени (мс с эпохи), подменяется в тестах
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t nowMs() const = 0; // Текущее время
};

// SystemClock — системное время
class SystemClock : public Clock {
public:
    int64_t nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// ManualClock — время двигается только вручную
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t startMs = 1700000000000LL) : now_(startMs) {}
    int64_t nowMs() const override { return now_.load(); }
    void advance(int64_t ms) { now_.fetch_add(ms); } // Сдвинуть
    void set(int64_t ms) { now_.store(ms); } // Установить
private:
    std::atomic<int64_t> now_;
};

constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;
constexpr int64_t MS_PER_WEEK = 7 * MS_PER_DAY;

} // namespace common
} // namespace core
} // namespace cachepilot

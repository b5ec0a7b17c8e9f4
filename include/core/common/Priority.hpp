#pragma once

#include <string>

namespace cachepilot {
namespace core {

// Приоритет записи/стратегии. Порядок значений важен для сортировки
enum class Priority {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

inline std::string toString(Priority p) {
    switch (p) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "medium";
}

inline Priority priorityFromString(const std::string& s) {
    if (s == "low") return Priority::Low;
    if (s == "high") return Priority::High;
    if (s == "critical") return Priority::Critical;
    return Priority::Medium;
}

} // namespace core
} // namespace cachepilot

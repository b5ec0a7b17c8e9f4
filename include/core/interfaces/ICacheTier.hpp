#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/common/Priority.hpp"

namespace cachepilot {
namespace core {

struct TierSetOptions {
    int64_t ttlMs = 0;                  // 0 = TTL тира по умолчанию
    Priority priority = Priority::Medium;
    bool compression = false;           // Разрешить сжатие
    bool persist = false;               // Запись на диск
};

struct TierGetOptions {
    bool validateIntegrity = true;      // Проверять контрольную сумму
};

// Статистика физического тира
struct TierStatistics {
    uint64_t hitCount = 0;
    uint64_t missCount = 0;
    uint64_t evictionCount = 0;
    uint64_t totalRequests = 0;
    double hitRate = 0.0;
    size_t memoryUsage = 0;        // байт
    size_t diskUsage = 0;          // байт
    double usagePercentage = 0.0;  // memoryUsage / capacity, [0,1]
    double compressionRatio = 1.0; // сжатый / исходный
    double averageAccessTime = 0.0; // мс, EMA
    size_t entryCount = 0;
    size_t capacity = 0;           // байт

    nlohmann::json toJson() const {
        return {
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"evictionCount", evictionCount},
            {"totalRequests", totalRequests},
            {"hitRate", hitRate},
            {"memoryUsage", memoryUsage},
            {"diskUsage", diskUsage},
            {"usagePercentage", usagePercentage},
            {"compressionRatio", compressionRatio},
            {"averageAccessTime", averageAccessTime},
            {"entryCount", entryCount},
            {"capacity", capacity}
        };
    }
};

// ICacheTier — физический тир кэша (память/диск)
class ICacheTier {
public:
    virtual ~ICacheTier() = default;
    virtual std::optional<nlohmann::json> get(const std::string& key, const TierGetOptions& options = {}) = 0;
    virtual bool set(const std::string& key, const nlohmann::json& value, const TierSetOptions& options = {}) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual size_t collectGarbage() = 0; // Удалить просроченные, вернуть кол-во
    virtual size_t capacity() const = 0;
    virtual void setCapacity(size_t bytes) = 0;
    virtual void setCompressionEnabled(bool enabled) = 0;
    virtual TierStatistics getStatistics() const = 0;
};

} // namespace core
} // namespace cachepilot

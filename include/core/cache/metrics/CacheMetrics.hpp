#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cachepilot {
namespace core {
namespace cache {

// CacheMetrics — сводные метрики всех тиров
struct CacheMetrics {
    uint64_t totalRequests = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    double hitRatio = 0.0;           // cacheHits / totalRequests
    double averageHitTime = 0.0;     // мс, EMA
    double averageMissTime = 0.0;    // мс, EMA
    double totalResponseTime = 0.0;  // мс, среднее по запросам
    size_t memoryUsage = 0;          // байт
    double memoryUtilization = 0.0;  // [0,1]
    double memoryFragmentation = 0.0;
    size_t diskUsage = 0;            // байт
    double compressionRatio = 1.0;   // сжатый / исходный
    size_t networkSavings = 0;       // байт
    size_t bytesServedFromCache = 0;
    size_t bytesDownloaded = 0;
    double evictionRate = 0.0;
    double prefetchAccuracy = 0.0;
    uint64_t errorCount = 0;
    double errorRate = 0.0;
    int64_t lastUpdate = 0;          // мс

    // Пересчёт производных полей после изменения счётчиков
    void recompute() {
        hitRatio = totalRequests > 0 ? static_cast<double>(cacheHits) / static_cast<double>(totalRequests) : 0.0;
        errorRate = totalRequests > 0 ? static_cast<double>(errorCount) / static_cast<double>(totalRequests) : 0.0;
        if (totalRequests > 0) {
            totalResponseTime = (averageHitTime * static_cast<double>(cacheHits) +
                                 averageMissTime * static_cast<double>(cacheMisses)) /
                                static_cast<double>(totalRequests);
        } else {
            totalResponseTime = 0.0;
        }
    }

    nlohmann::json toJson() const {
        return {
            {"totalRequests", totalRequests},
            {"cacheHits", cacheHits},
            {"cacheMisses", cacheMisses},
            {"hitRatio", hitRatio},
            {"averageHitTime", averageHitTime},
            {"averageMissTime", averageMissTime},
            {"totalResponseTime", totalResponseTime},
            {"memoryUsage", memoryUsage},
            {"memoryUtilization", memoryUtilization},
            {"memoryFragmentation", memoryFragmentation},
            {"diskUsage", diskUsage},
            {"compressionRatio", compressionRatio},
            {"networkSavings", networkSavings},
            {"bytesServedFromCache", bytesServedFromCache},
            {"bytesDownloaded", bytesDownloaded},
            {"evictionRate", evictionRate},
            {"prefetchAccuracy", prefetchAccuracy},
            {"errorCount", errorCount},
            {"errorRate", errorRate},
            {"lastUpdate", lastUpdate}
        };
    }

    static CacheMetrics fromJson(const nlohmann::json& j) {
        CacheMetrics m;
        m.totalRequests = j.value("totalRequests", uint64_t{0});
        m.cacheHits = j.value("cacheHits", uint64_t{0});
        m.cacheMisses = j.value("cacheMisses", uint64_t{0});
        m.averageHitTime = j.value("averageHitTime", 0.0);
        m.averageMissTime = j.value("averageMissTime", 0.0);
        m.memoryUsage = j.value("memoryUsage", size_t{0});
        m.memoryUtilization = j.value("memoryUtilization", 0.0);
        m.memoryFragmentation = j.value("memoryFragmentation", 0.0);
        m.diskUsage = j.value("diskUsage", size_t{0});
        m.compressionRatio = j.value("compressionRatio", 1.0);
        m.networkSavings = j.value("networkSavings", size_t{0});
        m.bytesServedFromCache = j.value("bytesServedFromCache", size_t{0});
        m.bytesDownloaded = j.value("bytesDownloaded", size_t{0});
        m.evictionRate = j.value("evictionRate", 0.0);
        m.prefetchAccuracy = j.value("prefetchAccuracy", 0.0);
        m.errorCount = j.value("errorCount", uint64_t{0});
        m.lastUpdate = j.value("lastUpdate", int64_t{0});
        m.recompute();
        return m;
    }
};

} // namespace cache
} // namespace core
} // namespace cachepilot

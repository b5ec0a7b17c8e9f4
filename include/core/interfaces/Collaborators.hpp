#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cachepilot {
namespace core {

// Примитив выполнения SQL: массив строк для SELECT или {"affected": n}.
// Ошибка выполнения сообщается исключением.
class IDatabaseExecutor {
public:
    virtual ~IDatabaseExecutor() = default;
    virtual nlohmann::json execute(const std::string& sql, const nlohmann::json& params) = 0;
};

struct AssetMetrics {
    uint64_t totalRequests = 0;
    uint64_t cacheHits = 0;
    size_t bytesServed = 0;      // отдано из CDN-кэша
    size_t bytesDownloaded = 0;
    double averageLoadTime = 0.0;

    nlohmann::json toJson() const {
        return {
            {"totalRequests", totalRequests},
            {"cacheHits", cacheHits},
            {"bytesServed", bytesServed},
            {"bytesDownloaded", bytesDownloaded},
            {"averageLoadTime", averageLoadTime}
        };
    }
};

// Загрузчик ассетов (CDN)
class IAssetFetcher {
public:
    virtual ~IAssetFetcher() = default;
    virtual std::optional<nlohmann::json> fetch(const std::string& key) = 0;
    virtual void registerAsset(const std::string& key, const nlohmann::json& metadata) = 0;
    virtual AssetMetrics getMetrics() const = 0;
};

struct ImageStats {
    size_t totalImages = 0;
    size_t originalBytes = 0;
    size_t compressedBytes = 0;
    double compressionRatio = 1.0; // сжатый / исходный
    double quality = 0.85;
};

// Конвейер изображений
class IImagePipeline {
public:
    virtual ~IImagePipeline() = default;
    virtual void analyzeImage(const std::string& key, const nlohmann::json& data) = 0;
    virtual void setCompressionQuality(double quality) = 0;
    virtual ImageStats getStats() const = 0;
};

struct MemoryPoolInfo {
    std::string name;
    size_t capacity = 0;
    size_t used = 0;
    double fragmentation = 0.0; // [0,1]
};

// Менеджер пулов памяти
class IMemoryPoolManager {
public:
    virtual ~IMemoryPoolManager() = default;
    virtual std::vector<MemoryPoolInfo> getPools() const = 0;
    virtual bool compactPool(const std::string& name) = 0;
    virtual size_t collectGarbage() = 0; // Освобождено байт
};

// Приёмник метрик
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;
    virtual void recordMetric(const std::string& name, double value, int64_t timestamp,
                              const std::string& category, const nlohmann::json& metadata) = 0;
};

} // namespace core
} // namespace cachepilot

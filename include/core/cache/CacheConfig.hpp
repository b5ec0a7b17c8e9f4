#pragma once
#include <cstdint>
#include <string>

namespace cachepilot {
namespace core {
namespace cache {

// CacheConfig — параметры тира памяти/диска (бюджет, TTL, сжатие, запись на диск)
struct CacheConfig {
    size_t maxMemorySize = 1024 * 1024 * 50;  // Бюджет памяти (50 MB)
    size_t maxEntries = 10000;                // Макс. записи
    int64_t defaultTtlMs = 3600 * 1000;       // TTL по умолчанию (1 час)
    bool enableCompression = true;            // Сжатие zlib
    size_t compressionThreshold = 1024;       // Сжимать от 1 KB
    double minCompressionGain = 0.1;          // Сжатие должно экономить >= 10%
    double reservedFraction = 0.1;            // Резерв бюджета памяти
    bool enablePersistence = true;            // Запись на диск через хранилище
    std::string keyPrefix = "cache_";         // Префикс ключей на диске
    bool validate() const {
        return maxMemorySize > 0 && maxEntries > 0 && defaultTtlMs >= 0 &&
               reservedFraction >= 0.0 && reservedFraction < 1.0 &&
               minCompressionGain >= 0.0 && minCompressionGain < 1.0;
    }
};

} // namespace cache
} // namespace core
} // namespace cachepilot

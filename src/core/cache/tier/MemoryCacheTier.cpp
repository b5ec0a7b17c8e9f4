#include "core/cache/tier/MemoryCacheTier.hpp"
#include "core/cache/dynamic/DynamicCache.hpp"
#include "core/common/Compression.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Hash.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace cachepilot {
namespace core {
namespace cache {

namespace {

// Запись тира: сериализованное (возможно сжатое) значение и контрольная сумма
struct TierEntry {
    std::string payload;
    bool compressed = false;
    size_t originalSize = 0;
    std::string checksum;
    Priority priority = Priority::Medium;
};

constexpr double EMA_ALPHA = 0.1;

} // namespace

// Реализация PIMPL
struct MemoryCacheTier::Impl {
    CacheConfig config;
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<spdlog::logger> logger;
    std::unique_ptr<DynamicCache<std::string, TierEntry>> memory;
    std::unordered_map<std::string, size_t> diskSizes; // ключ -> байт на диске
    mutable std::mutex mutex; // Сериализует запись и учёт бюджета

    std::atomic<size_t> memoryUsage{0};
    std::atomic<uint64_t> hitCount{0};
    std::atomic<uint64_t> missCount{0};
    std::atomic<uint64_t> evictionCount{0};
    std::atomic<bool> compressionEnabled{true};
    double compressionRatio = 1.0;
    double averageAccessTime = 0.0;

    Impl(const CacheConfig& cfg, std::shared_ptr<common::Clock> clk, std::shared_ptr<IKeyValueStore> kv)
        : config(cfg), clock(std::move(clk)), store(std::move(kv)), logger(common::getLogger("tier")) {
        if (!clock) {
            clock = std::make_shared<common::SystemClock>();
        }
        compressionEnabled = config.enableCompression;
        memory = std::make_unique<DynamicCache<std::string, TierEntry>>(config.maxEntries, clock, config.defaultTtlMs);
        // Истечение TTL и LRU-вытеснение внутри DynamicCache
        memory->setEvictionCallback([this](const std::string& key, const TierEntry& entry) {
            memoryUsage.fetch_sub(std::min(memoryUsage.load(), entry.payload.size()));
            evictionCount.fetch_add(1);
            logger->debug("MemoryCacheTier: запись вытеснена key={}, size={}", key, entry.payload.size());
        });
    }

    size_t usableBytes() const {
        return static_cast<size_t>(static_cast<double>(config.maxMemorySize) * (1.0 - config.reservedFraction));
    }

    void recordAccess(double ms) {
        std::lock_guard<std::mutex> lock(mutex);
        averageAccessTime = averageAccessTime * (1.0 - EMA_ALPHA) + ms * EMA_ALPHA;
    }

    bool fits(size_t incoming, bool isNewKey) const {
        bool bytesOk = memoryUsage.load() + incoming <= usableBytes();
        bool countOk = !isNewKey || memory->size() < config.maxEntries;
        return bytesOk && countOk;
    }

    // Освобождает место под запись. Вызывается под mutex
    bool makeRoom(const std::string& key, size_t incoming, bool isNewKey) {
        if (fits(incoming, isNewKey)) {
            return true;
        }
        memory->removeExpired();
        if (fits(incoming, isNewKey)) {
            return true;
        }
        auto keys = memory->keysLeastRecentFirst();
        for (Priority p : {Priority::Low, Priority::Medium, Priority::High}) {
            for (const auto& candidate : keys) {
                if (fits(incoming, isNewKey)) {
                    return true;
                }
                if (candidate == key) {
                    continue;
                }
                auto entry = memory->peek(candidate);
                if (!entry || entry->priority != p) {
                    continue;
                }
                memory->remove(candidate);
                memoryUsage.fetch_sub(std::min(memoryUsage.load(), entry->payload.size()));
                evictionCount.fetch_add(1);
                logger->debug("MemoryCacheTier: вытеснение key={} priority={}", candidate, toString(p));
            }
        }
        return fits(incoming, isNewKey);
    }

    void writeThrough(const std::string& key, const nlohmann::json& value, const TierEntry& entry, int64_t ttlMs) {
        if (!store || !config.enablePersistence) {
            return;
        }
        int64_t now = clock->nowMs();
        nlohmann::json record = {
            {"data", value},
            {"checksum", common::sha256Hex(value.dump())},
            {"createdAt", now},
            {"expiresAt", ttlMs > 0 ? now + ttlMs : 0},
            {"priority", toString(entry.priority)}
        };
        std::string blob = record.dump();
        try {
            store->set(config.keyPrefix + key, blob);
            std::lock_guard<std::mutex> lock(mutex);
            diskSizes[key] = blob.size();
        } catch (const std::exception& e) {
            logger->warn("MemoryCacheTier: ошибка записи на диск key={}: {}", key, e.what());
        }
    }

    void removeFromDisk(const std::string& key) {
        if (!store) {
            return;
        }
        try {
            store->remove(config.keyPrefix + key);
        } catch (const std::exception& e) {
            logger->warn("MemoryCacheTier: ошибка удаления с диска key={}: {}", key, e.what());
        }
        std::lock_guard<std::mutex> lock(mutex);
        diskSizes.erase(key);
    }

    std::optional<nlohmann::json> readFromDisk(const std::string& key, bool validate) {
        if (!store || !config.enablePersistence) {
            return std::nullopt;
        }
        std::optional<std::string> blob;
        try {
            blob = store->get(config.keyPrefix + key);
        } catch (const std::exception& e) {
            logger->warn("MemoryCacheTier: ошибка чтения с диска key={}: {}", key, e.what());
            return std::nullopt;
        }
        if (!blob) {
            return std::nullopt;
        }
        nlohmann::json record = nlohmann::json::parse(*blob, nullptr, false);
        if (record.is_discarded() || !record.contains("data")) {
            logger->warn("MemoryCacheTier: повреждённая запись на диске key={}", key);
            removeFromDisk(key);
            return std::nullopt;
        }
        int64_t now = clock->nowMs();
        int64_t expiresAt = record.value("expiresAt", int64_t{0});
        if (expiresAt > 0 && now >= expiresAt) {
            removeFromDisk(key);
            return std::nullopt;
        }
        if (validate && common::sha256Hex(record["data"].dump()) != record.value("checksum", std::string())) {
            logger->warn("MemoryCacheTier: контрольная сумма не совпала key={}", key);
            removeFromDisk(key);
            return std::nullopt;
        }
        // Поднимаем в память на оставшийся TTL
        TierSetOptions promote;
        promote.ttlMs = expiresAt > 0 ? expiresAt - now : 0;
        promote.priority = priorityFromString(record.value("priority", std::string("medium")));
        storeInMemory(key, record["data"], promote);
        return record["data"];
    }

    bool storeInMemory(const std::string& key, const nlohmann::json& value, const TierSetOptions& options) {
        std::string raw = value.dump();
        TierEntry entry;
        entry.originalSize = raw.size();
        entry.priority = options.priority;
        entry.payload = raw;

        bool wantCompression = (compressionEnabled.load() || options.compression) &&
                               raw.size() >= config.compressionThreshold;
        if (wantCompression) {
            auto packed = common::compress(raw);
            if (packed) {
                double ratio = static_cast<double>(packed->size()) / static_cast<double>(raw.size());
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    compressionRatio = compressionRatio * (1.0 - EMA_ALPHA) + ratio * EMA_ALPHA;
                }
                if (ratio <= 1.0 - config.minCompressionGain) {
                    entry.payload = std::move(*packed);
                    entry.compressed = true;
                }
            }
        }
        entry.checksum = common::sha256Hex(entry.payload);

        int64_t ttl = options.ttlMs > 0 ? options.ttlMs : config.defaultTtlMs;
        std::lock_guard<std::mutex> lock(mutex);
        if (entry.payload.size() > usableBytes()) {
            logger->warn("MemoryCacheTier: значение больше бюджета key={}, size={}", key, entry.payload.size());
            return false;
        }
        auto previous = memory->takeEntry(key);
        if (previous) {
            memoryUsage.fetch_sub(std::min(memoryUsage.load(), previous->data.payload.size()));
        }
        if (!makeRoom(key, entry.payload.size(), true)) {
            logger->warn("MemoryCacheTier: нет места для key={} (все записи critical)", key);
            if (previous) {
                memory->restore(key, *previous);
                memoryUsage.fetch_add(previous->data.payload.size());
            }
            return false;
        }
        size_t stored = entry.payload.size();
        memory->put(key, entry, ttl);
        memoryUsage.fetch_add(stored);
        return true;
    }
};

MemoryCacheTier::MemoryCacheTier(const CacheConfig& config,
                                 std::shared_ptr<common::Clock> clock,
                                 std::shared_ptr<IKeyValueStore> store)
    : pImpl(std::make_unique<Impl>(config, std::move(clock), std::move(store))) {
    pImpl->logger->info("MemoryCacheTier создан: maxMemorySize={}, maxEntries={}, compression={}",
                        config.maxMemorySize, config.maxEntries, config.enableCompression);
}

MemoryCacheTier::~MemoryCacheTier() = default;

std::optional<nlohmann::json> MemoryCacheTier::get(const std::string& key, const TierGetOptions& options) {
    auto start = std::chrono::high_resolution_clock::now();
    auto elapsedMs = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    };
    try {
        auto entry = pImpl->memory->get(key);
        if (entry) {
            if (options.validateIntegrity && common::sha256Hex(entry->payload) != entry->checksum) {
                pImpl->logger->warn("MemoryCacheTier: нарушена целостность key={}", key);
                remove(key);
                ++pImpl->missCount;
                return std::nullopt;
            }
            std::optional<std::string> raw = entry->compressed
                ? common::decompress(entry->payload, entry->originalSize)
                : std::optional<std::string>(entry->payload);
            nlohmann::json value = raw ? nlohmann::json::parse(*raw, nullptr, false) : nlohmann::json(nlohmann::json::value_t::discarded);
            if (value.is_discarded()) {
                pImpl->logger->warn("MemoryCacheTier: не удалось восстановить значение key={}", key);
                remove(key);
                ++pImpl->missCount;
                return std::nullopt;
            }
            ++pImpl->hitCount;
            pImpl->recordAccess(elapsedMs());
            return value;
        }

        auto fromDisk = pImpl->readFromDisk(key, options.validateIntegrity);
        if (fromDisk) {
            ++pImpl->hitCount;
            pImpl->recordAccess(elapsedMs());
            return fromDisk;
        }
    } catch (const std::exception& e) {
        pImpl->logger->error("MemoryCacheTier::get: key={}: {}", key, e.what());
    }
    ++pImpl->missCount;
    pImpl->recordAccess(elapsedMs());
    return std::nullopt;
}

bool MemoryCacheTier::set(const std::string& key, const nlohmann::json& value, const TierSetOptions& options) {
    try {
        if (!pImpl->storeInMemory(key, value, options)) {
            return false;
        }
        if (options.persist) {
            int64_t ttl = options.ttlMs > 0 ? options.ttlMs : pImpl->config.defaultTtlMs;
            TierEntry meta;
            meta.priority = options.priority;
            pImpl->writeThrough(key, value, meta, ttl);
        }
        return true;
    } catch (const std::exception& e) {
        pImpl->logger->error("MemoryCacheTier::set: key={}: {}", key, e.what());
        return false;
    }
}

bool MemoryCacheTier::remove(const std::string& key) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (auto existing = pImpl->memory->take(key)) {
            removed = true;
            pImpl->memoryUsage.fetch_sub(std::min(pImpl->memoryUsage.load(), existing->payload.size()));
        }
        removed = removed || pImpl->diskSizes.count(key) > 0;
    }
    pImpl->removeFromDisk(key);
    return removed;
}

void MemoryCacheTier::clear() {
    std::vector<std::string> diskKeys;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->memory->clear();
        pImpl->memoryUsage = 0;
        for (const auto& [key, size] : pImpl->diskSizes) {
            diskKeys.push_back(key);
        }
    }
    for (const auto& key : diskKeys) {
        pImpl->removeFromDisk(key);
    }
    pImpl->logger->info("MemoryCacheTier: очищен");
}

size_t MemoryCacheTier::collectGarbage() {
    size_t removed = pImpl->memory->removeExpired();
    pImpl->logger->debug("MemoryCacheTier: GC удалил {} записей", removed);
    return removed;
}

size_t MemoryCacheTier::capacity() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config.maxMemorySize;
}

void MemoryCacheTier::setCapacity(size_t bytes) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->config.maxMemorySize = std::max<size_t>(bytes, 1);
    pImpl->makeRoom(std::string(), 0, false);
    pImpl->logger->info("MemoryCacheTier: новый бюджет памяти {} байт", pImpl->config.maxMemorySize);
}

void MemoryCacheTier::setCompressionEnabled(bool enabled) {
    pImpl->compressionEnabled = enabled;
}

TierStatistics MemoryCacheTier::getStatistics() const {
    TierStatistics stats;
    stats.hitCount = pImpl->hitCount.load();
    stats.missCount = pImpl->missCount.load();
    stats.evictionCount = pImpl->evictionCount.load();
    stats.totalRequests = stats.hitCount + stats.missCount;
    stats.hitRate = stats.totalRequests > 0
        ? static_cast<double>(stats.hitCount) / static_cast<double>(stats.totalRequests) : 0.0;
    stats.memoryUsage = pImpl->memoryUsage.load();
    stats.entryCount = pImpl->memory->size();

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& [key, size] : pImpl->diskSizes) {
        stats.diskUsage += size;
    }
    stats.capacity = pImpl->config.maxMemorySize;
    stats.usagePercentage = static_cast<double>(stats.memoryUsage) / static_cast<double>(stats.capacity);
    stats.compressionRatio = pImpl->compressionRatio;
    stats.averageAccessTime = pImpl->averageAccessTime;
    return stats;
}

size_t MemoryCacheTier::getEntryCount() const {
    return pImpl->memory->size();
}

CacheConfig MemoryCacheTier::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace cache
} // namespace core
} // namespace cachepilot

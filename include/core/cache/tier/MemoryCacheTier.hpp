#pragma once

#include <memory>
#include <string>
#include "core/cache/CacheConfig.hpp"
#include "core/common/Clock.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/interfaces/IKeyValueStore.hpp"

namespace cachepilot {
namespace core {
namespace cache {

// MemoryCacheTier — тир памяти поверх DynamicCache с записью на диск через хранилище.
// Вытеснение по (приоритет, LRU), critical-записи не вытесняются.
// Значения сжимаются zlib, целостность проверяется по SHA-256.
class MemoryCacheTier : public ICacheTier {
public:
    MemoryCacheTier(const CacheConfig& config,
                    std::shared_ptr<common::Clock> clock,
                    std::shared_ptr<IKeyValueStore> store = nullptr); // Конструктор
    ~MemoryCacheTier() override; // Деструктор
    MemoryCacheTier(const MemoryCacheTier&) = delete;
    MemoryCacheTier& operator=(const MemoryCacheTier&) = delete;

    std::optional<nlohmann::json> get(const std::string& key, const TierGetOptions& options = {}) override;
    bool set(const std::string& key, const nlohmann::json& value, const TierSetOptions& options = {}) override;
    bool remove(const std::string& key) override;
    void clear() override;
    size_t collectGarbage() override;
    size_t capacity() const override;
    void setCapacity(size_t bytes) override;
    void setCompressionEnabled(bool enabled) override;
    TierStatistics getStatistics() const override;

    size_t getEntryCount() const; // Кол-во записей в памяти
    CacheConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace cachepilot

#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/common/Clock.hpp"

namespace cachepilot {
namespace core {
namespace cache {

// DynamicCache — потокобезопасный LRU-кэш с TTL в миллисекундах.
// Время берётся из внедрённого Clock, фонового потока нет:
// просроченные записи удаляются при чтении и в removeExpired().
template<typename Key, typename Value>
class DynamicCache {
public:
    using KeyType = Key;
    using DataType = Value;
    using EvictionCallback = std::function<void(const Key&, const Value&)>;
    struct Entry {
        DataType data;
        int64_t storedAt;  // мс
        int64_t ttlMs;     // 0 = бессрочно
    };
    DynamicCache(size_t initialSize, std::shared_ptr<common::Clock> clock, int64_t defaultTtlMs = 0); // Конструктор
    std::optional<Value> get(const Key& key); // Получить (обновляет LRU)
    std::optional<Value> peek(const Key& key) const; // Получить без LRU
    void put(const Key& key, const Value& value); // Сохранить
    void put(const Key& key, const Value& value, int64_t ttlMs); // Сохранить с TTL
    bool remove(const Key& key); // Удалить
    std::optional<Value> take(const Key& key); // Удалить и вернуть, даже просроченное
    std::optional<Entry> takeEntry(const Key& key); // То же, вместе с временем записи и TTL
    void restore(const Key& key, const Entry& entry); // Вернуть запись, снятую takeEntry
    void clear(); // Очистить
    bool contains(const Key& key) const; // Есть и не просрочен
    size_t size() const; // Размер
    size_t allocatedSize() const; // Выделено
    void resize(size_t newSize); // Изменить размер
    void setEvictionCallback(EvictionCallback cb); // Callback вытеснения
    void batchPut(const std::unordered_map<KeyType, DataType>& data, int64_t ttlMs = 0); // Массовое добавление
    std::unordered_map<Key, Value> exportAll() const; // Экспорт
    std::vector<Key> keysLeastRecentFirst() const; // Ключи от старых к новым
    size_t removeExpired(); // Очистка просроченных
    size_t evictionCount() const { return evictions_.load(); }
private:
    bool isExpired(const Entry& entry, int64_t now) const;
    void evictLRU();
    size_t allocatedSize_;
    int64_t defaultTtlMs_;
    std::shared_ptr<common::Clock> clock_;
    std::unordered_map<KeyType, std::pair<typename std::list<KeyType>::iterator, Entry>> cache_;
    std::list<KeyType> lruList_;
    mutable std::shared_mutex mutex_;
    EvictionCallback evictionCallback_;
    std::atomic<size_t> evictions_{0};
};

// --- Константы для DynamicCache ---
constexpr size_t MIN_CACHE_ENTRIES = 1;

template<typename Key, typename Value>
DynamicCache<Key, Value>::DynamicCache(size_t initialSize, std::shared_ptr<common::Clock> clock, int64_t defaultTtlMs)
    : allocatedSize_(std::max(MIN_CACHE_ENTRIES, initialSize)), defaultTtlMs_(defaultTtlMs), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<common::SystemClock>();
    }
    cache_.reserve(allocatedSize_);
    spdlog::debug("DynamicCache: создан, initialSize={}, defaultTtlMs={}", allocatedSize_, defaultTtlMs_);
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::isExpired(const Entry& entry, int64_t now) const {
    return entry.ttlMs > 0 && now - entry.storedAt >= entry.ttlMs;
}

template<typename Key, typename Value>
std::optional<Value> DynamicCache<Key, Value>::get(const Key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }

    // Проверка TTL
    if (isExpired(it->second.second, clock_->nowMs())) {
        Value expired = it->second.second.data;
        lruList_.erase(it->second.first);
        cache_.erase(it);
        auto cb = evictionCallback_;
        lock.unlock();
        if (cb) {
            cb(key, expired);
        }
        return std::nullopt;
    }

    // Обновляем LRU
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
    return it->second.second.data;
}

template<typename Key, typename Value>
std::optional<Value> DynamicCache<Key, Value>::peek(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end() || isExpired(it->second.second, clock_->nowMs())) {
        return std::nullopt;
    }
    return it->second.second.data;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::put(const Key& key, const Value& value) {
    put(key, value, defaultTtlMs_);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::put(const Key& key, const Value& value, int64_t ttlMs) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    int64_t now = clock_->nowMs();

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.second = Entry{value, now, ttlMs};
        lruList_.splice(lruList_.begin(), lruList_, it->second.first);
        return;
    }

    if (cache_.size() >= allocatedSize_) {
        evictLRU();
    }
    lruList_.push_front(key);
    cache_[key] = std::make_pair(lruList_.begin(), Entry{value, now, ttlMs});
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::remove(const Key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    lruList_.erase(it->second.first);
    cache_.erase(it);
    return true;
}

template<typename Key, typename Value>
std::optional<Value> DynamicCache<Key, Value>::take(const Key& key) {
    auto entry = takeEntry(key);
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->data);
}

template<typename Key, typename Value>
std::optional<typename DynamicCache<Key, Value>::Entry> DynamicCache<Key, Value>::takeEntry(const Key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    Entry entry = std::move(it->second.second);
    lruList_.erase(it->second.first);
    cache_.erase(it);
    return entry;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::restore(const Key& key, const Entry& entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.second = entry;
        lruList_.splice(lruList_.begin(), lruList_, it->second.first);
        return;
    }
    if (cache_.size() >= allocatedSize_) {
        evictLRU();
    }
    lruList_.push_front(key);
    cache_[key] = std::make_pair(lruList_.begin(), entry);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::contains(const Key& key) const {
    return peek(key).has_value();
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::allocatedSize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return allocatedSize_;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::resize(size_t newSize) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    allocatedSize_ = std::max(MIN_CACHE_ENTRIES, newSize);
    while (cache_.size() > allocatedSize_) {
        evictLRU();
    }
    spdlog::debug("DynamicCache: новый размер {}", allocatedSize_);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::setEvictionCallback(EvictionCallback cb) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    evictionCallback_ = std::move(cb);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::batchPut(const std::unordered_map<KeyType, DataType>& data, int64_t ttlMs) {
    for (const auto& [key, value] : data) {
        put(key, value, ttlMs);
    }
}

template<typename Key, typename Value>
std::unordered_map<Key, Value> DynamicCache<Key, Value>::exportAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::unordered_map<Key, Value> result;
    int64_t now = clock_->nowMs();
    for (const auto& [key, entry] : cache_) {
        if (!isExpired(entry.second, now)) {
            result[key] = entry.second.data;
        }
    }
    return result;
}

template<typename Key, typename Value>
std::vector<Key> DynamicCache<Key, Value>::keysLeastRecentFirst() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<Key>(lruList_.rbegin(), lruList_.rend());
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::removeExpired() {
    std::vector<std::pair<Key, Value>> expired;
    EvictionCallback cb;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cb = evictionCallback_;
        int64_t now = clock_->nowMs();
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (isExpired(it->second.second, now)) {
                expired.emplace_back(it->first, it->second.second.data);
                lruList_.erase(it->second.first);
                it = cache_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (cb) {
        for (const auto& [key, value] : expired) {
            cb(key, value);
        }
    }
    return expired.size();
}

// Вызывается под unique_lock
template<typename Key, typename Value>
void DynamicCache<Key, Value>::evictLRU() {
    if (lruList_.empty()) {
        return;
    }
    const Key victim = lruList_.back();
    auto it = cache_.find(victim);
    if (it != cache_.end()) {
        if (evictionCallback_) {
            evictionCallback_(victim, it->second.second.data);
        }
        cache_.erase(it);
    }
    lruList_.pop_back();
    evictions_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace cache
} // namespace core
} // namespace cachepilot

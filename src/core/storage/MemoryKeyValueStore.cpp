#include "core/storage/MemoryKeyValueStore.hpp"

namespace cachepilot {
namespace core {
namespace storage {

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
}

std::vector<std::pair<std::string, std::optional<std::string>>> MemoryKeyValueStore::multiGet(
    const std::vector<std::string>& keys) {
    std::vector<std::pair<std::string, std::optional<std::string>>> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.emplace_back(key, get(key));
    }
    return result;
}

void MemoryKeyValueStore::multiRemove(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : keys) {
        data_.erase(key);
    }
}

std::vector<std::string> MemoryKeyValueStore::getAllKeys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(data_.size());
    for (const auto& [key, value] : data_) {
        keys.push_back(key);
    }
    return keys;
}

size_t MemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

} // namespace storage
} // namespace core
} // namespace cachepilot

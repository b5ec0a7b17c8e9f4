#pragma once

#include <mutex>
#include <unordered_map>
#include "core/interfaces/IKeyValueStore.hpp"

namespace cachepilot {
namespace core {
namespace storage {

// MemoryKeyValueStore — хранилище в памяти (тесты, демо)
class MemoryKeyValueStore : public IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::vector<std::pair<std::string, std::optional<std::string>>> multiGet(
        const std::vector<std::string>& keys) override;
    void multiRemove(const std::vector<std::string>& keys) override;
    std::vector<std::string> getAllKeys() override;
    size_t size() const;
private:
    std::unordered_map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace core
} // namespace cachepilot

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/interfaces/IKeyValueStore.hpp"

namespace cachepilot {
namespace core {
namespace storage {

// FileKeyValueStore — по одному JSON-файлу на ключ в каталоге storagePath.
// Файл: {"key": <исходный ключ>, "value": <строка>}
class FileKeyValueStore : public IKeyValueStore {
public:
    explicit FileKeyValueStore(const std::string& storagePath); // Создаёт каталог
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::vector<std::pair<std::string, std::optional<std::string>>> multiGet(
        const std::vector<std::string>& keys) override;
    void multiRemove(const std::vector<std::string>& keys) override;
    std::vector<std::string> getAllKeys() override;
    const std::filesystem::path& path() const { return root_; }
private:
    std::filesystem::path fileFor(const std::string& key) const;
    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace core
} // namespace cachepilot

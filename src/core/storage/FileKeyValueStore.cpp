#include "core/storage/FileKeyValueStore.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Hash.hpp"
#include "core/common/Logging.hpp"
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace cachepilot {
namespace core {
namespace storage {

FileKeyValueStore::FileKeyValueStore(const std::string& storagePath)
    : root_(storagePath) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw PersistenceError("FileKeyValueStore: не удалось создать каталог " + root_.string() + ": " + ec.message());
    }
    common::getLogger("storage")->info("FileKeyValueStore: каталог {}", root_.string());
}

std::filesystem::path FileKeyValueStore::fileFor(const std::string& key) const {
    // Читаемый префикс + хеш полного ключа
    std::string safe;
    for (char c : key.substr(0, 48)) {
        safe += (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') ? c : '_';
    }
    return root_ / (safe + "_" + common::shortHash(key, 12) + ".json");
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = fileFor(key);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            throw PersistenceError("FileKeyValueStore: не удалось открыть " + path.string());
        }
        nlohmann::json j;
        ifs >> j;
        return j.at("value").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("FileKeyValueStore: повреждён файл " + path.string() + ": " + e.what());
    }
}

void FileKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = fileFor(key);
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        throw PersistenceError("FileKeyValueStore: не удалось записать " + path.string());
    }
    nlohmann::json j = {{"key", key}, {"value", value}};
    ofs << j.dump();
    if (!ofs) {
        throw PersistenceError("FileKeyValueStore: ошибка записи " + path.string());
    }
}

void FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(fileFor(key), ec);
    if (ec) {
        throw PersistenceError("FileKeyValueStore: не удалось удалить ключ " + key + ": " + ec.message());
    }
}

std::vector<std::pair<std::string, std::optional<std::string>>> FileKeyValueStore::multiGet(
    const std::vector<std::string>& keys) {
    std::vector<std::pair<std::string, std::optional<std::string>>> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.emplace_back(key, get(key));
    }
    return result;
}

void FileKeyValueStore::multiRemove(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        remove(key);
    }
}

std::vector<std::string> FileKeyValueStore::getAllKeys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        throw PersistenceError("FileKeyValueStore: не удалось прочитать каталог " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            std::ifstream ifs(entry.path());
            nlohmann::json j;
            ifs >> j;
            keys.push_back(j.at("key").get<std::string>());
        } catch (const std::exception& e) {
            common::getLogger("storage")->warn("FileKeyValueStore: пропущен файл {}: {}", entry.path().string(), e.what());
        }
    }
    return keys;
}

} // namespace storage
} // namespace core
} // namespace cachepilot

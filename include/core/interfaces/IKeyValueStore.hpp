#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cachepilot {
namespace core {

// Постоянное key-value хранилище строк (JSON-блобы).
// Ошибки ввода-вывода сообщаются через PersistenceError.
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual std::vector<std::pair<std::string, std::optional<std::string>>> multiGet(
        const std::vector<std::string>& keys) = 0;
    virtual void multiRemove(const std::vector<std::string>& keys) = 0;
    virtual std::vector<std::string> getAllKeys() = 0;
};

} // namespace core
} // namespace cachepilot

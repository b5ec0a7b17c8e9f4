#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/engine/EngineConfig.hpp"

namespace cachepilot {
namespace core {
namespace config {

// ConfigLoader — EngineConfig из JSON и обратно.
// Отсутствующие ключи сохраняют значения по умолчанию, ключ неверного типа
// или конфиг, не прошедший validate(), отклоняют весь документ.
class ConfigLoader {
public:
    static std::optional<engine::EngineConfig> parseJsonString(const std::string& text, std::string* error = nullptr);
    static std::optional<engine::EngineConfig> parseJsonFile(const std::string& path, std::string* error = nullptr);

    // Бросает nlohmann::json::exception или std::invalid_argument при несовпадении типов
    static engine::EngineConfig fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const engine::EngineConfig& config);
};

} // namespace config
} // namespace core
} // namespace cachepilot

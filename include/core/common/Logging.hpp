#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cachepilot {
namespace core {
namespace common {

// Именованный логгер компонента: logs/<name>.log (ротация 5MB x 2).
// Если файловый sink не создать, возвращается логгер по умолчанию.
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Уровень для всех зарегистрированных логгеров ("trace".."off")
void setLogLevel(const std::string& level);

} // namespace common
} // namespace core
} // namespace cachepilot

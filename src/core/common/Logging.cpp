#include "core/common/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace cachepilot {
namespace core {
namespace common {

namespace {
std::mutex loggerMutex;
spdlog::level::level_enum currentLevel = spdlog::level::info;
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    try {
        std::filesystem::create_directories("logs");
        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/" + name + ".log", 1024 * 1024 * 5, 2);
        auto logger = std::make_shared<spdlog::logger>(name, rotating_sink);
        logger->set_level(currentLevel);
        spdlog::register_logger(logger);
        return logger;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
    }
    return spdlog::default_logger();
}

void setLogLevel(const std::string& level) {
    std::lock_guard<std::mutex> lock(loggerMutex);
    currentLevel = spdlog::level::from_str(level);
    spdlog::set_level(currentLevel);
}

} // namespace common
} // namespace core
} // namespace cachepilot

#pragma once

#include <optional>
#include <string>

namespace cachepilot {
namespace core {
namespace common {

// zlib deflate/inflate. nullopt при ошибке zlib
std::optional<std::string> compress(const std::string& data, int level = -1);
std::optional<std::string> decompress(const std::string& data, size_t originalSize);

} // namespace common
} // namespace core
} // namespace cachepilot

#pragma once

#include <string>

namespace cachepilot {
namespace core {
namespace common {

std::string sha256Hex(const std::string& data); // SHA-256, hex (64 символа)
std::string shortHash(const std::string& data, size_t length = 16); // Префикс sha256Hex
std::string generateId(const std::string& prefix); // <prefix>_<ms>_<8 hex>

} // namespace common
} // namespace core
} // namespace cachepilot

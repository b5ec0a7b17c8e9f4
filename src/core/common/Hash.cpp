#include "core/common/Hash.hpp"
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace cachepilot {
namespace core {
namespace common {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string shortHash(const std::string& data, size_t length) {
    return sha256Hex(data).substr(0, length);
}

std::string generateId(const std::string& prefix) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << prefix << "_" << now << "_" << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return ss.str();
}

} // namespace common
} // namespace core
} // namespace cachepilot

#include "core/common/Compression.hpp"
#include <zlib.h>
#include <vector>

namespace cachepilot {
namespace core {
namespace common {

std::optional<std::string> compress(const std::string& data, int level) {
    uLongf destLen = compressBound(static_cast<uLong>(data.size()));
    std::vector<Bytef> buffer(destLen);
    int rc = compress2(buffer.data(), &destLen,
                       reinterpret_cast<const Bytef*>(data.data()),
                       static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()), destLen);
}

std::optional<std::string> decompress(const std::string& data, size_t originalSize) {
    std::vector<Bytef> buffer(originalSize > 0 ? originalSize : 1);
    uLongf destLen = static_cast<uLongf>(originalSize);
    int rc = uncompress(buffer.data(), &destLen,
                        reinterpret_cast<const Bytef*>(data.data()),
                        static_cast<uLong>(data.size()));
    if (rc != Z_OK || destLen != originalSize) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()), destLen);
}

} // namespace common
} // namespace core
} // namespace cachepilot

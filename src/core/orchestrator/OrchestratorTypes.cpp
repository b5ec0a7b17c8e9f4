#include "core/orchestrator/OrchestratorTypes.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace cachepilot {
namespace core {
namespace orchestrator {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Расширение без query-строки и фрагмента, в нижнем регистре
std::string extensionOf(const std::string& key) {
    std::string path = key.substr(0, key.find_first_of("?#"));
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return std::string();
    }
    return toLower(path.substr(dot + 1));
}

const std::array<const char*, 7> IMAGE_EXTENSIONS = {"jpg", "jpeg", "png", "gif", "webp", "svg", "bmp"};
const std::array<const char*, 9> ASSET_EXTENSIONS = {"woff", "woff2", "ttf", "otf", "mp4", "webm", "mp3", "wav", "ogg"};

template <size_t N>
bool contains(const std::array<const char*, N>& list, const std::string& value) {
    return std::any_of(list.begin(), list.end(), [&](const char* item) { return value == item; });
}

} // namespace

std::string toString(CacheLevel level) {
    switch (level) {
        case CacheLevel::Auto: return "auto";
        case CacheLevel::Memory: return "memory";
        case CacheLevel::Predictive: return "predictive";
        case CacheLevel::Cdn: return "cdn";
        case CacheLevel::Query: return "query";
    }
    return "auto";
}

CacheLevel cacheLevelFromString(const std::string& s) {
    if (s == "memory") return CacheLevel::Memory;
    if (s == "predictive") return CacheLevel::Predictive;
    if (s == "cdn") return CacheLevel::Cdn;
    if (s == "query") return CacheLevel::Query;
    return CacheLevel::Auto;
}

std::string toString(DataSource source) {
    switch (source) {
        case DataSource::None: return "none";
        case DataSource::Memory: return "memory";
        case DataSource::Predictive: return "predictive";
        case DataSource::Cdn: return "cdn";
        case DataSource::Query: return "query";
        case DataSource::Fallback: return "fallback";
    }
    return "none";
}

nlohmann::json OptimizationResult::toJson() const {
    return {
        {"before", before.toJson()},
        {"after", after.toJson()},
        {"improvements", improvements},
        {"actions", actions},
        {"recommendations", recommendations}
    };
}

nlohmann::json PerformanceReport::toJson() const {
    nlohmann::json j;
    j["overallScore"] = overallScore;
    j["grade"] = grade;
    j["status"] = status;
    j["scores"] = {
        {"cache", scores.cache},
        {"memory", scores.memory},
        {"database", scores.database},
        {"images", scores.images},
        {"predictions", scores.predictions}
    };
    j["metrics"] = metrics.toJson();
    j["alerts"] = nlohmann::json::array();
    for (const auto& a : alerts) {
        j["alerts"].push_back(a.toJson());
    }
    j["recommendations"] = recommendations;
    j["generatedAt"] = generatedAt;
    return j;
}

std::string gradeForScore(int score) {
    if (score >= 90) return "A";
    if (score >= 80) return "B";
    if (score >= 70) return "C";
    if (score >= 60) return "D";
    return "F";
}

std::string statusForScore(int score) {
    if (score >= 90) return "excellent";
    if (score >= 80) return "good";
    if (score >= 70) return "fair";
    if (score >= 60) return "poor";
    return "critical";
}

nlohmann::json OrchestratorConfig::toJson() const {
    return {
        {"healthCheckIntervalMs", healthCheckIntervalMs},
        {"baselineRefreshTicks", baselineRefreshTicks},
        {"degradationThreshold", degradationThreshold},
        {"fragmentationThreshold", fragmentationThreshold},
        {"evictionRateThreshold", evictionRateThreshold},
        {"hitRatioThreshold", hitRatioThreshold},
        {"memoryPressureThreshold", memoryPressureThreshold},
        {"capacityGrowFactor", capacityGrowFactor},
        {"capacityShrinkFactor", capacityShrinkFactor},
        {"weakCompressionRatio", weakCompressionRatio},
        {"reducedImageQuality", reducedImageQuality}
    };
}

OrchestratorConfig OrchestratorConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, OrchestratorConfig());
}

OrchestratorConfig OrchestratorConfig::fromJson(const nlohmann::json& j, const OrchestratorConfig& defaults) {
    OrchestratorConfig c = defaults;
    c.healthCheckIntervalMs = j.value("healthCheckIntervalMs", c.healthCheckIntervalMs);
    c.baselineRefreshTicks = j.value("baselineRefreshTicks", c.baselineRefreshTicks);
    c.degradationThreshold = j.value("degradationThreshold", c.degradationThreshold);
    c.fragmentationThreshold = j.value("fragmentationThreshold", c.fragmentationThreshold);
    c.evictionRateThreshold = j.value("evictionRateThreshold", c.evictionRateThreshold);
    c.hitRatioThreshold = j.value("hitRatioThreshold", c.hitRatioThreshold);
    c.memoryPressureThreshold = j.value("memoryPressureThreshold", c.memoryPressureThreshold);
    c.capacityGrowFactor = j.value("capacityGrowFactor", c.capacityGrowFactor);
    c.capacityShrinkFactor = j.value("capacityShrinkFactor", c.capacityShrinkFactor);
    c.weakCompressionRatio = j.value("weakCompressionRatio", c.weakCompressionRatio);
    c.reducedImageQuality = j.value("reducedImageQuality", c.reducedImageQuality);
    return c;
}

bool isAssetKey(const std::string& key) {
    if (startsWith(key, "asset:") || startsWith(key, "http://") || startsWith(key, "https://")) {
        return true;
    }
    std::string ext = extensionOf(key);
    return !ext.empty() && (contains(IMAGE_EXTENSIONS, ext) || contains(ASSET_EXTENSIONS, ext));
}

bool isQueryKey(const std::string& key) {
    if (startsWith(key, "query:")) {
        return true;
    }
    auto begin = key.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return false;
    }
    return toLower(key.substr(begin, 7)) == "select ";
}

bool isImageKey(const std::string& key) {
    return contains(IMAGE_EXTENSIONS, extensionOf(key));
}

bool isImageValue(const nlohmann::json& value) {
    if (!value.is_object()) {
        return false;
    }
    for (const char* field : {"mimeType", "contentType"}) {
        auto it = value.find(field);
        if (it != value.end() && it->is_string() && startsWith(toLower(it->get<std::string>()), "image/")) {
            return true;
        }
    }
    return false;
}

std::string queryText(const std::string& key) {
    return startsWith(key, "query:") ? key.substr(6) : key;
}

} // namespace orchestrator
} // namespace core
} // namespace cachepilot

#include "core/config/ConfigLoader.hpp"
#include "core/common/Logging.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace cachepilot {
namespace core {
namespace config {

namespace {

const std::set<std::string> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "critical", "off"};

// Секция верхнего уровня: отсутствует -> пустой объект, не объект -> ошибка
nlohmann::json section(const nlohmann::json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) {
        return nlohmann::json::object();
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

cache::CacheConfig tierFromJson(const nlohmann::json& j) {
    cache::CacheConfig c;
    c.maxMemorySize = j.value("maxMemorySize", c.maxMemorySize);
    c.maxEntries = j.value("maxEntries", c.maxEntries);
    c.defaultTtlMs = j.value("defaultTtlMs", c.defaultTtlMs);
    c.enableCompression = j.value("enableCompression", c.enableCompression);
    c.compressionThreshold = j.value("compressionThreshold", c.compressionThreshold);
    c.minCompressionGain = j.value("minCompressionGain", c.minCompressionGain);
    c.reservedFraction = j.value("reservedFraction", c.reservedFraction);
    c.enablePersistence = j.value("enablePersistence", c.enablePersistence);
    c.keyPrefix = j.value("keyPrefix", c.keyPrefix);
    return c;
}

nlohmann::json tierToJson(const cache::CacheConfig& c) {
    return {
        {"maxMemorySize", c.maxMemorySize},
        {"maxEntries", c.maxEntries},
        {"defaultTtlMs", c.defaultTtlMs},
        {"enableCompression", c.enableCompression},
        {"compressionThreshold", c.compressionThreshold},
        {"minCompressionGain", c.minCompressionGain},
        {"reservedFraction", c.reservedFraction},
        {"enablePersistence", c.enablePersistence},
        {"keyPrefix", c.keyPrefix}
    };
}

telemetry::TelemetryConfig telemetryFromJson(const nlohmann::json& j) {
    telemetry::TelemetryConfig c;
    c.maxEventsHistory = j.value("maxEventsHistory", c.maxEventsHistory);
    c.maxAlerts = j.value("maxAlerts", c.maxAlerts);
    c.monitoringIntervalMs = j.value("monitoringIntervalMs", c.monitoringIntervalMs);
    c.analysisWindowMs = j.value("analysisWindowMs", c.analysisWindowMs);
    c.persistEveryNTicks = j.value("persistEveryNTicks", c.persistEveryNTicks);
    c.thresholds = telemetry::AlertThresholds::fromJson(section(j, "thresholds"));
    return c;
}

nlohmann::json telemetryToJson(const telemetry::TelemetryConfig& c) {
    return {
        {"maxEventsHistory", c.maxEventsHistory},
        {"maxAlerts", c.maxAlerts},
        {"monitoringIntervalMs", c.monitoringIntervalMs},
        {"analysisWindowMs", c.analysisWindowMs},
        {"persistEveryNTicks", c.persistEveryNTicks},
        {"thresholds", c.thresholds.toJson()}
    };
}

prediction::PredictorConfig predictorFromJson(const nlohmann::json& j) {
    prediction::PredictorConfig c;
    c.maxPatterns = j.value("maxPatterns", c.maxPatterns);
    c.minConfidence = j.value("minConfidence", c.minConfidence);
    c.minSimilarity = j.value("minSimilarity", c.minSimilarity);
    c.patternMaxAgeMs = j.value("patternMaxAgeMs", c.patternMaxAgeMs);
    c.selfTuneIntervalMs = j.value("selfTuneIntervalMs", c.selfTuneIntervalMs);
    c.backgroundStaggerMs = j.value("backgroundStaggerMs", c.backgroundStaggerMs);
    c.preemptiveIntervalMs = j.value("preemptiveIntervalMs", c.preemptiveIntervalMs);
    // Таблицы заменяются целиком
    if (j.contains("actionDataTypes")) {
        c.actionDataTypes = section(j, "actionDataTypes").get<std::map<std::string, std::string>>();
    }
    if (j.contains("dataTypeSizes")) {
        c.dataTypeSizes = section(j, "dataTypeSizes").get<std::map<std::string, size_t>>();
    }
    return c;
}

nlohmann::json predictorToJson(const prediction::PredictorConfig& c) {
    return {
        {"maxPatterns", c.maxPatterns},
        {"minConfidence", c.minConfidence},
        {"minSimilarity", c.minSimilarity},
        {"patternMaxAgeMs", c.patternMaxAgeMs},
        {"selfTuneIntervalMs", c.selfTuneIntervalMs},
        {"backgroundStaggerMs", c.backgroundStaggerMs},
        {"preemptiveIntervalMs", c.preemptiveIntervalMs},
        {"actionDataTypes", c.actionDataTypes},
        {"dataTypeSizes", c.dataTypeSizes}
    };
}

thread::ThreadPoolConfig threadPoolFromJson(const nlohmann::json& j) {
    thread::ThreadPoolConfig c;
    c.minThreads = j.value("minThreads", c.minThreads);
    c.maxThreads = j.value("maxThreads", c.maxThreads);
    c.queueSize = j.value("queueSize", c.queueSize);
    return c;
}

} // namespace

engine::EngineConfig ConfigLoader::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration root must be an object");
    }
    engine::EngineConfig c;
    c.logLevel = j.value("logLevel", c.logLevel);
    c.storagePath = j.value("storagePath", c.storagePath);
    c.enableMonitoring = j.value("enableMonitoring", c.enableMonitoring);
    c.enablePrediction = j.value("enablePrediction", c.enablePrediction);
    c.enableQueryOptimization = j.value("enableQueryOptimization", c.enableQueryOptimization);
    c.tier = tierFromJson(section(j, "tier"));
    c.telemetry = telemetryFromJson(section(j, "telemetry"));
    c.predictor = predictorFromJson(section(j, "predictor"));
    c.query = query::QueryOptimizerConfig::fromJson(section(j, "query"));
    c.orchestrator = orchestrator::OrchestratorConfig::fromJson(section(j, "orchestrator"));
    c.threadPool = threadPoolFromJson(section(j, "threadPool"));
    if (!LOG_LEVELS.count(c.logLevel)) {
        throw std::invalid_argument("unknown logLevel '" + c.logLevel + "'");
    }
    return c;
}

nlohmann::json ConfigLoader::toJson(const engine::EngineConfig& c) {
    return {
        {"logLevel", c.logLevel},
        {"storagePath", c.storagePath},
        {"enableMonitoring", c.enableMonitoring},
        {"enablePrediction", c.enablePrediction},
        {"enableQueryOptimization", c.enableQueryOptimization},
        {"tier", tierToJson(c.tier)},
        {"telemetry", telemetryToJson(c.telemetry)},
        {"predictor", predictorToJson(c.predictor)},
        {"query", c.query.toJson()},
        {"orchestrator", c.orchestrator.toJson()},
        {"threadPool", {
            {"minThreads", c.threadPool.minThreads},
            {"maxThreads", c.threadPool.maxThreads},
            {"queueSize", c.threadPool.queueSize}
        }}
    };
}

std::optional<engine::EngineConfig> ConfigLoader::parseJsonString(const std::string& text, std::string* error) {
    auto logger = common::getLogger("engine");
    std::string message;
    try {
        engine::EngineConfig config = fromJson(nlohmann::json::parse(text));
        if (config.validate()) {
            return config;
        }
        message = "configuration failed validation";
    } catch (const nlohmann::json::exception& e) {
        message = e.what();
    } catch (const std::invalid_argument& e) {
        message = e.what();
    }
    logger->error("ConfigLoader: конфигурация отклонена: {}", message);
    if (error) {
        *error = message;
    }
    return std::nullopt;
}

std::optional<engine::EngineConfig> ConfigLoader::parseJsonFile(const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        common::getLogger("engine")->error("ConfigLoader: не удалось открыть {}", path);
        if (error) {
            *error = "cannot open " + path;
        }
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJsonString(buffer.str(), error);
}

} // namespace config
} // namespace core
} // namespace cachepilot

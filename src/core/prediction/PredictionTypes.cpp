#include "core/prediction/PredictionTypes.hpp"

namespace cachepilot {
namespace core {
namespace prediction {

nlohmann::json LoadingContext::toJson() const {
    return {
        {"route", route},
        {"userId", userId},
        {"timestamp", timestamp},
        {"networkType", networkType},
        {"batteryLevel", batteryLevel},
        {"isCharging", isCharging},
        {"timeOfDay", timeOfDay},
        {"dayOfWeek", dayOfWeek},
        {"appVersion", appVersion}
    };
}

LoadingContext LoadingContext::fromJson(const nlohmann::json& j) {
    LoadingContext c;
    c.route = j.value("route", c.route);
    c.userId = j.value("userId", c.userId);
    c.timestamp = j.value("timestamp", int64_t{0});
    c.networkType = j.value("networkType", c.networkType);
    c.batteryLevel = j.value("batteryLevel", c.batteryLevel);
    c.isCharging = j.value("isCharging", c.isCharging);
    c.timeOfDay = j.value("timeOfDay", c.timeOfDay);
    c.dayOfWeek = j.value("dayOfWeek", c.dayOfWeek);
    c.appVersion = j.value("appVersion", c.appVersion);
    return c;
}

nlohmann::json PredictivePattern::toJson() const {
    return {
        {"id", id},
        {"sequence", sequence},
        {"confidence", confidence},
        {"frequency", frequency},
        {"context", context.toJson()},
        {"successRate", successRate},
        {"averageLoadTime", averageLoadTime},
        {"lastUsed", lastUsed}
    };
}

PredictivePattern PredictivePattern::fromJson(const nlohmann::json& j) {
    PredictivePattern p;
    p.id = j.value("id", std::string());
    if (j.contains("sequence") && j["sequence"].is_array()) {
        p.sequence = j["sequence"].get<std::vector<std::string>>();
    }
    p.confidence = j.value("confidence", p.confidence);
    p.frequency = j.value("frequency", p.frequency);
    if (j.contains("context") && j["context"].is_object()) {
        p.context = LoadingContext::fromJson(j["context"]);
    }
    p.successRate = j.value("successRate", 0.0);
    p.averageLoadTime = j.value("averageLoadTime", 0.0);
    p.lastUsed = j.value("lastUsed", int64_t{0});
    return p;
}

std::string toString(StrategyType type) {
    switch (type) {
        case StrategyType::Immediate: return "immediate";
        case StrategyType::Background: return "background";
        case StrategyType::OnDemand: return "on-demand";
        case StrategyType::Preemptive: return "preemptive";
    }
    return "background";
}

nlohmann::json PredictionResult::toJson() const {
    return {
        {"dataType", dataType},
        {"probability", probability},
        {"strategy", {
            {"type", toString(strategy.type)},
            {"priority", toString(strategy.priority)},
            {"batchSize", strategy.batchSize},
            {"retryCount", strategy.retryCount},
            {"timeout", strategy.timeoutMs},
            {"networkDependent", strategy.networkDependent}
        }},
        {"estimatedSize", estimatedSize},
        {"cacheDuration", cacheDurationMs}
    };
}

nlohmann::json LoadingMetrics::toJson() const {
    return {
        {"totalPredictions", totalPredictions},
        {"successfulPredictions", successfulPredictions},
        {"failedPredictions", failedPredictions},
        {"averagePredictionAccuracy", averagePredictionAccuracy},
        {"totalDataPreloaded", totalDataPreloaded},
        {"cacheHitImprovement", cacheHitImprovement},
        {"networkSavings", networkSavings}
    };
}

LoadingMetrics LoadingMetrics::fromJson(const nlohmann::json& j) {
    LoadingMetrics m;
    m.totalPredictions = j.value("totalPredictions", uint64_t{0});
    m.successfulPredictions = j.value("successfulPredictions", uint64_t{0});
    m.failedPredictions = j.value("failedPredictions", uint64_t{0});
    m.averagePredictionAccuracy = j.value("averagePredictionAccuracy", 0.0);
    m.totalDataPreloaded = j.value("totalDataPreloaded", size_t{0});
    m.cacheHitImprovement = j.value("cacheHitImprovement", 0.0);
    m.networkSavings = j.value("networkSavings", 0.0);
    return m;
}

} // namespace prediction
} // namespace core
} // namespace cachepilot

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Clock.hpp"
#include "core/common/Priority.hpp"

namespace cachepilot {
namespace core {
namespace prediction {

// Снимок контекста пользователя
struct LoadingContext {
    std::string route = "unknown";
    std::string userId = "anonymous";
    int64_t timestamp = 0;
    std::string networkType = "unknown"; // wifi / cellular / ...
    double batteryLevel = 1.0;           // [0,1]
    bool isCharging = false;
    int timeOfDay = 0;                   // час 0..23
    int dayOfWeek = 0;                   // 0 = воскресенье
    std::string appVersion = "1.0.0";

    nlohmann::json toJson() const;
    static LoadingContext fromJson(const nlohmann::json& j);
};

// Частичное обновление контекста: заданы только изменённые поля
struct ContextUpdate {
    std::optional<std::string> route;
    std::optional<std::string> userId;
    std::optional<std::string> networkType;
    std::optional<double> batteryLevel;
    std::optional<bool> isCharging;
    std::optional<int> timeOfDay;
    std::optional<int> dayOfWeek;
    std::optional<std::string> appVersion;
};

struct PredictivePattern {
    std::string id;
    std::vector<std::string> sequence;
    double confidence = 0.1;
    uint64_t frequency = 1;
    LoadingContext context;
    double successRate = 0.0;
    double averageLoadTime = 0.0; // мс
    int64_t lastUsed = 0;

    nlohmann::json toJson() const;
    static PredictivePattern fromJson(const nlohmann::json& j);
};

enum class StrategyType { Immediate, Background, OnDemand, Preemptive };
std::string toString(StrategyType type);

struct LoadingStrategy {
    StrategyType type = StrategyType::Background;
    Priority priority = Priority::Medium;
    int batchSize = 3;
    int retryCount = 1;
    double timeoutMs = 5000.0;
    bool networkDependent = true;
};

struct PredictionResult {
    std::string dataType;
    double probability = 0.0;
    LoadingStrategy strategy;
    size_t estimatedSize = 0; // байт
    int64_t cacheDurationMs = 0;

    nlohmann::json toJson() const;
};

struct LoadingMetrics {
    uint64_t totalPredictions = 0;
    uint64_t successfulPredictions = 0;
    uint64_t failedPredictions = 0;
    double averagePredictionAccuracy = 0.0;
    size_t totalDataPreloaded = 0;
    double cacheHitImprovement = 0.0;
    double networkSavings = 0.0;
    size_t patternsCount = 0; // только в getMetrics()
    size_t queueLength = 0;   // только в getMetrics()

    nlohmann::json toJson() const;
    static LoadingMetrics fromJson(const nlohmann::json& j);
};

struct PredictorConfig {
    size_t maxPatterns = 500;
    double minConfidence = 0.3;
    double minSimilarity = 0.3;
    int64_t patternMaxAgeMs = 30 * common::MS_PER_DAY;
    int64_t selfTuneIntervalMs = 15 * common::MS_PER_MINUTE;
    int64_t backgroundStaggerMs = 1000;
    int64_t preemptiveIntervalMs = 500;
    std::map<std::string, std::string> actionDataTypes = {
        {"view_pet_profile", "pet_profile_data"},
        {"view_health_records", "health_records_data"},
        {"view_photos", "photo_gallery_data"},
        {"view_family", "family_coordination_data"},
        {"view_reminders", "care_reminders_data"},
        {"view_lost_pets", "lost_pet_alerts_data"}
    };
    std::map<std::string, size_t> dataTypeSizes = {
        {"pet_profile_data", 2048},
        {"health_records_data", 4096},
        {"photo_gallery_data", 51200},
        {"family_coordination_data", 1024},
        {"care_reminders_data", 2048},
        {"lost_pet_alerts_data", 3072}
    };

    bool validate() const {
        return maxPatterns > 0 && minConfidence >= 0.0 && minConfidence <= 1.0 &&
               minSimilarity >= 0.0 && minSimilarity <= 1.0 && patternMaxAgeMs > 0 &&
               selfTuneIntervalMs > 0 && backgroundStaggerMs >= 0 && preemptiveIntervalMs >= 0;
    }
};

} // namespace prediction
} // namespace core
} // namespace cachepilot

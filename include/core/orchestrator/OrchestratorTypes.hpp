#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/common/Cancellation.hpp"
#include "core/common/Priority.hpp"
#include "core/telemetry/TelemetryTypes.hpp"

namespace cachepilot {
namespace core {
namespace orchestrator {

// Уровень поиска: auto проходит всю цепочку тиров, остальные опрашивают один тир
enum class CacheLevel { Auto, Memory, Predictive, Cdn, Query };

std::string toString(CacheLevel level);
CacheLevel cacheLevelFromString(const std::string& s);

struct CacheStrategy {
    CacheLevel level = CacheLevel::Auto;
    int64_t ttlMs = 0;                 // 0 = TTL тира
    Priority priority = Priority::Medium;
    bool compression = false;
    bool persist = false;
    bool enablePrediction = true;
};

using Fallback = std::function<nlohmann::json()>;
using Validator = std::function<bool(const nlohmann::json&)>;

struct GetOptions {
    CacheStrategy strategy;
    Fallback fallback;              // Вызывается, когда все тиры промахнулись
    Validator validate;             // false = запись устарела
    common::CancellationToken cancel;
};

// Откуда пришли данные
enum class DataSource { None, Memory, Predictive, Cdn, Query, Fallback };
std::string toString(DataSource source);

struct GetResult {
    std::optional<nlohmann::json> data;
    bool fromCache = false;
    DataSource source = DataSource::None;
    double durationMs = 0.0;
};

struct SetOptions {
    CacheStrategy strategy;
    bool skipPrediction = false;
};

// Итог optimizePerformance
struct OptimizationResult {
    cache::CacheMetrics before;
    cache::CacheMetrics after;
    std::map<std::string, double> improvements; // after - before
    std::vector<std::string> actions;
    std::vector<std::string> recommendations;

    nlohmann::json toJson() const;
};

struct HealthCheckResult {
    double degradation = 0.0;
    bool optimized = false;
    bool baselineRefreshed = false;
};

struct ComponentScores {
    double cache = 0.0;
    double memory = 0.0;
    double database = 0.0;
    double images = 0.0;
    double predictions = 0.0;
};

struct PerformanceReport {
    int overallScore = 0;
    std::string grade;   // A..F
    std::string status;  // excellent / good / fair / poor / critical
    ComponentScores scores;
    cache::CacheMetrics metrics;
    std::vector<telemetry::PerformanceAlert> alerts;
    std::vector<std::string> recommendations;
    int64_t generatedAt = 0;

    nlohmann::json toJson() const;
};

std::string gradeForScore(int score);
std::string statusForScore(int score);

struct OrchestratorConfig {
    int64_t healthCheckIntervalMs = 60000;
    size_t baselineRefreshTicks = 10;       // Обновлять базу раз в N проверок
    double degradationThreshold = 0.2;
    double fragmentationThreshold = 0.3;
    double evictionRateThreshold = 0.1;
    double hitRatioThreshold = 0.7;
    double memoryPressureThreshold = 0.85;
    double capacityGrowFactor = 1.25;
    double capacityShrinkFactor = 0.8;
    double weakCompressionRatio = 0.8;
    double reducedImageQuality = 0.7;

    bool validate() const {
        return healthCheckIntervalMs > 0 && baselineRefreshTicks > 0 &&
               degradationThreshold > 0.0 && fragmentationThreshold >= 0.0 && fragmentationThreshold <= 1.0 &&
               capacityGrowFactor > 1.0 && capacityShrinkFactor > 0.0 && capacityShrinkFactor < 1.0 &&
               reducedImageQuality > 0.0 && reducedImageQuality <= 1.0;
    }
    nlohmann::json toJson() const;
    static OrchestratorConfig fromJson(const nlohmann::json& j);
    static OrchestratorConfig fromJson(const nlohmann::json& j, const OrchestratorConfig& defaults);
};

// Классификация ключей и значений
bool isAssetKey(const std::string& key);   // asset:, URL, расширение картинки/шрифта/медиа
bool isQueryKey(const std::string& key);   // query: или текст SELECT
bool isImageKey(const std::string& key);
bool isImageValue(const nlohmann::json& value); // mimeType/contentType image/*
std::string queryText(const std::string& key); // Без префикса query:

} // namespace orchestrator
} // namespace core
} // namespace cachepilot

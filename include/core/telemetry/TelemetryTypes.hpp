#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/common/Clock.hpp"

namespace cachepilot {
namespace core {
namespace telemetry {

using cache::CacheMetrics;

enum class EventType { Hit, Miss, Eviction, Prefetch, Error };
enum class EventSource { Memory, Disk, Network, Cdn };

std::string toString(EventType type);
std::string toString(EventSource source);
EventType eventTypeFromString(const std::string& s);
EventSource eventSourceFromString(const std::string& s);

// Событие доступа к кэшу
struct CacheEvent {
    std::string id;            // Пустой id назначается при записи
    int64_t timestamp = 0;     // 0 = время записи
    EventType type = EventType::Miss;
    std::string key;
    double duration = 0.0;     // мс
    std::optional<size_t> size;
    EventSource source = EventSource::Memory;
    nlohmann::json metadata;   // null или объект

    nlohmann::json toJson() const;
    static CacheEvent fromJson(const nlohmann::json& j);
};

enum class AlertType { PerformanceDegradation, MemoryPressure, HighMissRate, NetworkIssues, EvictionPressure };
enum class Severity { Low, Medium, High, Critical };

std::string toString(AlertType type);
std::string toString(Severity severity);
AlertType alertTypeFromString(const std::string& s);
Severity severityFromString(const std::string& s);

struct PerformanceAlert {
    std::string id;
    AlertType type = AlertType::PerformanceDegradation;
    Severity severity = Severity::Low;
    std::string message;
    std::map<std::string, double> metrics;
    int64_t timestamp = 0;
    bool acknowledged = false;
    std::vector<std::string> actions;

    nlohmann::json toJson() const;
    static PerformanceAlert fromJson(const nlohmann::json& j);
};

enum class TrendPeriod { Hour, Day, Week };
std::string toString(TrendPeriod period);

// Прогноз ключевых метрик на шаг вперёд
struct MetricForecast {
    int step = 0;
    double hitRatio = 0.0;
    double memoryUtilization = 0.0;
    double totalResponseTime = 0.0;
};

struct CacheTrend {
    TrendPeriod period = TrendPeriod::Hour;
    std::vector<CacheMetrics> metrics;
    std::vector<int64_t> timestamps;        // Начало корзины, мс
    std::vector<MetricForecast> predictions; // Пусто, пока точек < 3

    nlohmann::json toJson() const;
    static CacheTrend fromJson(const nlohmann::json& j);
};

enum class RecommendationType { CacheSize, EvictionPolicy, PrefetchStrategy, Compression, TtlAdjustment };
std::string toString(RecommendationType type);

struct OptimizationRecommendation {
    std::string id;
    RecommendationType type = RecommendationType::CacheSize;
    std::string priority; // high / medium / low
    std::string description;
    std::string expectedImprovement;
    std::string implementation;
    double impactScore = 0.0;

    nlohmann::json toJson() const;
};

// Пороги алертов
struct AlertThresholds {
    double hitRatio = 0.7;
    double hitRatioHigh = 0.5;            // ниже: severity high
    double memoryUtilization = 0.85;
    double memoryUtilizationCritical = 0.95;
    double averageResponseTime = 500.0;   // мс
    double averageResponseTimeHigh = 1000.0;
    double evictionRate = 0.1;
    double evictionRateHigh = 0.25;
    double errorRate = 0.05;
    double errorRateHigh = 0.15;

    bool validate() const {
        return hitRatio >= 0.0 && hitRatio <= 1.0 && hitRatioHigh <= hitRatio &&
               memoryUtilization > 0.0 && memoryUtilizationCritical >= memoryUtilization &&
               averageResponseTime > 0.0 && averageResponseTimeHigh >= averageResponseTime &&
               evictionRate >= 0.0 && evictionRateHigh >= evictionRate &&
               errorRate >= 0.0 && errorRateHigh >= errorRate;
    }
    nlohmann::json toJson() const;
    static AlertThresholds fromJson(const nlohmann::json& j);
};

struct TelemetryConfig {
    size_t maxEventsHistory = 1000;
    size_t maxAlerts = 100;                          // Хранимые алерты (подтверждённые удаляются первыми)
    int64_t monitoringIntervalMs = 10000;
    int64_t analysisWindowMs = 5 * common::MS_PER_MINUTE;
    size_t persistEveryNTicks = 6;                   // Сохранение раз в N тиков
    AlertThresholds thresholds;

    bool validate() const {
        return maxEventsHistory >= 10 && maxAlerts > 0 && monitoringIntervalMs > 0 &&
               analysisWindowMs > 0 && persistEveryNTicks > 0 && thresholds.validate();
    }
};

// Отчёт аналитики
struct EfficiencyScores {
    double cacheEfficiency = 0.0;   // %
    double networkEfficiency = 0.0; // %
    double memoryEfficiency = 0.0;  // %
    int overallScore = 0;
};

struct AnalyticsReport {
    CacheMetrics metrics;
    std::vector<std::string> insights;
    std::vector<PerformanceAlert> alerts;
    std::vector<OptimizationRecommendation> recommendations;
    EfficiencyScores efficiency;

    nlohmann::json toJson() const;
};

} // namespace telemetry
} // namespace core
} // namespace cachepilot

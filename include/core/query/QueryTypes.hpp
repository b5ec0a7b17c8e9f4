#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Cancellation.hpp"
#include "core/common/Clock.hpp"

namespace cachepilot {
namespace core {
namespace query {

// Метрики одного выполнения запроса
struct QueryMetrics {
    std::string queryId;
    std::string sql;
    double executionTime = 0.0; // мс
    size_t resultCount = 0;
    bool cacheHit = false;
    int64_t timestamp = 0;
    nlohmann::json parameters = nlohmann::json::array();
    std::optional<std::string> errorMessage;

    nlohmann::json toJson() const;
    static QueryMetrics fromJson(const nlohmann::json& j);
};

// Агрегат по нормализованному тексту запроса
struct QueryPattern {
    std::string pattern;
    uint64_t frequency = 0;
    double averageExecutionTime = 0.0; // Скользящее среднее, мс
    int64_t lastExecuted = 0;
    bool cacheable = true;
    std::vector<std::string> indexSuggestions;
    double optimizationScore = 10.0; // [0,10]

    nlohmann::json toJson() const;
    static QueryPattern fromJson(const nlohmann::json& j);
};

// Правило статического анализа. Срабатывает, если pattern найден, а exclude не найден
struct QueryOptimizationRule {
    std::string id;
    std::string name;
    std::string description;
    std::regex pattern;
    std::optional<std::regex> exclude;
    std::string severity; // low / medium / high / critical
    std::string suggestion;
    std::function<std::string(const std::string&)> autoFix; // Пусто = только рекомендация
    double impact = 0.0;
};

// Рекомендуемый индекс (только совет)
struct DatabaseIndex {
    std::string table;
    std::vector<std::string> columns;
    std::string type = "btree";
    bool unique = false;
    size_t size = 0;
    uint64_t usage = 0;         // Взвешенная частота
    double effectiveness = 0.0; // [0,10], относительно самого частого

    nlohmann::json toJson() const;
    static DatabaseIndex fromJson(const nlohmann::json& j);
};

struct QueryIssue {
    std::string ruleId;
    std::string name;
    std::string severity;
    std::string suggestion;
};

struct QueryAnalysis {
    std::vector<QueryIssue> issues;
    double optimizationScore = 10.0;
    double estimatedTime = 0.0; // мс
    std::vector<std::string> indexSuggestions;

    nlohmann::json toJson() const;
};

struct SlowQuerySummary {
    std::string pattern;
    double avgTime = 0.0;
    uint64_t frequency = 0;
};

struct QueryAnalytics {
    size_t totalQueries = 0;
    size_t slowQueries = 0;
    double averageExecutionTime = 0.0;
    double cacheHitRate = 0.0;
    std::vector<SlowQuerySummary> topSlowQueries; // не больше 10
    double optimizationScore = 10.0;

    nlohmann::json toJson() const;
};

// Итог периодической оптимизации
struct PeriodicOptimizationSummary {
    size_t slowFrequentPatterns = 0;
    size_t poorlyOptimizedPatterns = 0;
    size_t indexRecommendations = 0;
    size_t purgedQueries = 0;
    size_t purgedPatterns = 0;
};

struct QueryOptions {
    bool useCache = true;
    int64_t cacheTtlMs = 0;       // 0 = cacheTtlMs конфигурации
    bool enableOptimization = true;
    size_t maxResults = 0;        // 0 = без ограничения
    common::CancellationToken cancel; // после отмены результат не кэшируется
};

struct QueryOptimizerConfig {
    bool enableQueryCaching = true;
    bool enableQueryRewriting = true;
    int64_t cacheTtlMs = 5 * common::MS_PER_MINUTE;
    double slowQueryThreshold = 1000.0; // мс
    size_t maxResultSetSize = 10000;
    bool enableBatching = true;
    size_t batchSize = 10;
    int64_t batchDebounceMs = 100;
    size_t maxPatterns = 1000;
    size_t maxTrackedQueries = 1000;
    size_t maxMetricsPerQuery = 100;
    size_t persistEveryNQueries = 10;
    int64_t optimizationIntervalMs = 5 * common::MS_PER_MINUTE;
    int64_t retentionMs = common::MS_PER_DAY;
    size_t maxIndexRecommendations = 20;

    bool validate() const {
        return cacheTtlMs > 0 && slowQueryThreshold > 0.0 && maxResultSetSize > 0 && batchSize > 0 &&
               batchDebounceMs >= 0 && maxPatterns > 0 && maxTrackedQueries > 0 && maxMetricsPerQuery > 0 &&
               persistEveryNQueries > 0 && optimizationIntervalMs > 0 && retentionMs > 0 &&
               maxIndexRecommendations > 0;
    }
    nlohmann::json toJson() const;
    static QueryOptimizerConfig fromJson(const nlohmann::json& j);
    static QueryOptimizerConfig fromJson(const nlohmann::json& j, const QueryOptimizerConfig& defaults);
};

} // namespace query
} // namespace core
} // namespace cachepilot

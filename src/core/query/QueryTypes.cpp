#include "core/query/QueryTypes.hpp"

namespace cachepilot {
namespace core {
namespace query {

nlohmann::json QueryMetrics::toJson() const {
    nlohmann::json j = {
        {"queryId", queryId},
        {"sql", sql},
        {"executionTime", executionTime},
        {"resultCount", resultCount},
        {"cacheHit", cacheHit},
        {"timestamp", timestamp},
        {"parameters", parameters}
    };
    if (errorMessage) {
        j["errorMessage"] = *errorMessage;
    }
    return j;
}

QueryMetrics QueryMetrics::fromJson(const nlohmann::json& j) {
    QueryMetrics m;
    m.queryId = j.value("queryId", std::string());
    m.sql = j.value("sql", std::string());
    m.executionTime = j.value("executionTime", 0.0);
    m.resultCount = j.value("resultCount", size_t{0});
    m.cacheHit = j.value("cacheHit", false);
    m.timestamp = j.value("timestamp", int64_t{0});
    if (j.contains("parameters")) {
        m.parameters = j["parameters"];
    }
    if (j.contains("errorMessage") && j["errorMessage"].is_string()) {
        m.errorMessage = j["errorMessage"].get<std::string>();
    }
    return m;
}

nlohmann::json QueryPattern::toJson() const {
    return {
        {"pattern", pattern},
        {"frequency", frequency},
        {"averageExecutionTime", averageExecutionTime},
        {"lastExecuted", lastExecuted},
        {"cacheable", cacheable},
        {"indexSuggestions", indexSuggestions},
        {"optimizationScore", optimizationScore}
    };
}

QueryPattern QueryPattern::fromJson(const nlohmann::json& j) {
    QueryPattern p;
    p.pattern = j.value("pattern", std::string());
    p.frequency = j.value("frequency", uint64_t{0});
    p.averageExecutionTime = j.value("averageExecutionTime", 0.0);
    p.lastExecuted = j.value("lastExecuted", int64_t{0});
    p.cacheable = j.value("cacheable", true);
    if (j.contains("indexSuggestions") && j["indexSuggestions"].is_array()) {
        p.indexSuggestions = j["indexSuggestions"].get<std::vector<std::string>>();
    }
    p.optimizationScore = j.value("optimizationScore", 10.0);
    return p;
}

nlohmann::json DatabaseIndex::toJson() const {
    return {
        {"table", table},
        {"columns", columns},
        {"type", type},
        {"unique", unique},
        {"size", size},
        {"usage", usage},
        {"effectiveness", effectiveness}
    };
}

DatabaseIndex DatabaseIndex::fromJson(const nlohmann::json& j) {
    DatabaseIndex idx;
    idx.table = j.value("table", std::string("unknown"));
    if (j.contains("columns") && j["columns"].is_array()) {
        idx.columns = j["columns"].get<std::vector<std::string>>();
    }
    idx.type = j.value("type", std::string("btree"));
    idx.unique = j.value("unique", false);
    idx.size = j.value("size", size_t{0});
    idx.usage = j.value("usage", uint64_t{0});
    idx.effectiveness = j.value("effectiveness", 0.0);
    return idx;
}

nlohmann::json QueryAnalysis::toJson() const {
    nlohmann::json j;
    j["issues"] = nlohmann::json::array();
    for (const auto& issue : issues) {
        j["issues"].push_back({
            {"rule", issue.ruleId},
            {"name", issue.name},
            {"severity", issue.severity},
            {"suggestion", issue.suggestion}
        });
    }
    j["optimizationScore"] = optimizationScore;
    j["estimatedTime"] = estimatedTime;
    j["indexSuggestions"] = indexSuggestions;
    return j;
}

nlohmann::json QueryAnalytics::toJson() const {
    nlohmann::json slow = nlohmann::json::array();
    for (const auto& q : topSlowQueries) {
        slow.push_back({{"pattern", q.pattern}, {"avgTime", q.avgTime}, {"frequency", q.frequency}});
    }
    return {
        {"totalQueries", totalQueries},
        {"slowQueries", slowQueries},
        {"averageExecutionTime", averageExecutionTime},
        {"cacheHitRate", cacheHitRate},
        {"topSlowQueries", slow},
        {"optimizationScore", optimizationScore}
    };
}

nlohmann::json QueryOptimizerConfig::toJson() const {
    return {
        {"enableQueryCaching", enableQueryCaching},
        {"enableQueryRewriting", enableQueryRewriting},
        {"cacheTtlMs", cacheTtlMs},
        {"slowQueryThreshold", slowQueryThreshold},
        {"maxResultSetSize", maxResultSetSize},
        {"enableBatching", enableBatching},
        {"batchSize", batchSize},
        {"batchDebounceMs", batchDebounceMs},
        {"maxPatterns", maxPatterns},
        {"maxTrackedQueries", maxTrackedQueries},
        {"maxMetricsPerQuery", maxMetricsPerQuery},
        {"persistEveryNQueries", persistEveryNQueries},
        {"optimizationIntervalMs", optimizationIntervalMs},
        {"retentionMs", retentionMs},
        {"maxIndexRecommendations", maxIndexRecommendations}
    };
}

QueryOptimizerConfig QueryOptimizerConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, QueryOptimizerConfig());
}

QueryOptimizerConfig QueryOptimizerConfig::fromJson(const nlohmann::json& j, const QueryOptimizerConfig& defaults) {
    QueryOptimizerConfig c = defaults;
    c.enableQueryCaching = j.value("enableQueryCaching", c.enableQueryCaching);
    c.enableQueryRewriting = j.value("enableQueryRewriting", c.enableQueryRewriting);
    c.cacheTtlMs = j.value("cacheTtlMs", c.cacheTtlMs);
    c.slowQueryThreshold = j.value("slowQueryThreshold", c.slowQueryThreshold);
    c.maxResultSetSize = j.value("maxResultSetSize", c.maxResultSetSize);
    c.enableBatching = j.value("enableBatching", c.enableBatching);
    c.batchSize = j.value("batchSize", c.batchSize);
    c.batchDebounceMs = j.value("batchDebounceMs", c.batchDebounceMs);
    c.maxPatterns = j.value("maxPatterns", c.maxPatterns);
    c.maxTrackedQueries = j.value("maxTrackedQueries", c.maxTrackedQueries);
    c.maxMetricsPerQuery = j.value("maxMetricsPerQuery", c.maxMetricsPerQuery);
    c.persistEveryNQueries = j.value("persistEveryNQueries", c.persistEveryNQueries);
    c.optimizationIntervalMs = j.value("optimizationIntervalMs", c.optimizationIntervalMs);
    c.retentionMs = j.value("retentionMs", c.retentionMs);
    c.maxIndexRecommendations = j.value("maxIndexRecommendations", c.maxIndexRecommendations);
    return c;
}

} // namespace query
} // namespace core
} // namespace cachepilot

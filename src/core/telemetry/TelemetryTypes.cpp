#include "core/telemetry/TelemetryTypes.hpp"

namespace cachepilot {
namespace core {
namespace telemetry {

std::string toString(EventType type) {
    switch (type) {
        case EventType::Hit: return "hit";
        case EventType::Miss: return "miss";
        case EventType::Eviction: return "eviction";
        case EventType::Prefetch: return "prefetch";
        case EventType::Error: return "error";
    }
    return "miss";
}

std::string toString(EventSource source) {
    switch (source) {
        case EventSource::Memory: return "memory";
        case EventSource::Disk: return "disk";
        case EventSource::Network: return "network";
        case EventSource::Cdn: return "cdn";
    }
    return "memory";
}

EventType eventTypeFromString(const std::string& s) {
    if (s == "hit") return EventType::Hit;
    if (s == "eviction") return EventType::Eviction;
    if (s == "prefetch") return EventType::Prefetch;
    if (s == "error") return EventType::Error;
    return EventType::Miss;
}

EventSource eventSourceFromString(const std::string& s) {
    if (s == "disk") return EventSource::Disk;
    if (s == "network") return EventSource::Network;
    if (s == "cdn") return EventSource::Cdn;
    return EventSource::Memory;
}

nlohmann::json CacheEvent::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"timestamp", timestamp},
        {"type", toString(type)},
        {"key", key},
        {"duration", duration},
        {"source", toString(source)}
    };
    if (size) {
        j["size"] = *size;
    }
    if (!metadata.is_null()) {
        j["metadata"] = metadata;
    }
    return j;
}

CacheEvent CacheEvent::fromJson(const nlohmann::json& j) {
    CacheEvent e;
    e.id = j.value("id", std::string());
    e.timestamp = j.value("timestamp", int64_t{0});
    e.type = eventTypeFromString(j.value("type", std::string("miss")));
    e.key = j.value("key", std::string());
    e.duration = j.value("duration", 0.0);
    if (j.contains("size") && j["size"].is_number()) {
        e.size = j["size"].get<size_t>();
    }
    e.source = eventSourceFromString(j.value("source", std::string("memory")));
    if (j.contains("metadata")) {
        e.metadata = j["metadata"];
    }
    return e;
}

std::string toString(AlertType type) {
    switch (type) {
        case AlertType::PerformanceDegradation: return "performance_degradation";
        case AlertType::MemoryPressure: return "memory_pressure";
        case AlertType::HighMissRate: return "high_miss_rate";
        case AlertType::NetworkIssues: return "network_issues";
        case AlertType::EvictionPressure: return "eviction_pressure";
    }
    return "performance_degradation";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

AlertType alertTypeFromString(const std::string& s) {
    if (s == "memory_pressure") return AlertType::MemoryPressure;
    if (s == "high_miss_rate") return AlertType::HighMissRate;
    if (s == "network_issues") return AlertType::NetworkIssues;
    if (s == "eviction_pressure") return AlertType::EvictionPressure;
    return AlertType::PerformanceDegradation;
}

Severity severityFromString(const std::string& s) {
    if (s == "medium") return Severity::Medium;
    if (s == "high") return Severity::High;
    if (s == "critical") return Severity::Critical;
    return Severity::Low;
}

nlohmann::json PerformanceAlert::toJson() const {
    return {
        {"id", id},
        {"type", toString(type)},
        {"severity", toString(severity)},
        {"message", message},
        {"metrics", metrics},
        {"timestamp", timestamp},
        {"acknowledged", acknowledged},
        {"actions", actions}
    };
}

PerformanceAlert PerformanceAlert::fromJson(const nlohmann::json& j) {
    PerformanceAlert a;
    a.id = j.value("id", std::string());
    a.type = alertTypeFromString(j.value("type", std::string()));
    a.severity = severityFromString(j.value("severity", std::string()));
    a.message = j.value("message", std::string());
    if (j.contains("metrics") && j["metrics"].is_object()) {
        a.metrics = j["metrics"].get<std::map<std::string, double>>();
    }
    a.timestamp = j.value("timestamp", int64_t{0});
    a.acknowledged = j.value("acknowledged", false);
    if (j.contains("actions") && j["actions"].is_array()) {
        a.actions = j["actions"].get<std::vector<std::string>>();
    }
    return a;
}

std::string toString(TrendPeriod period) {
    switch (period) {
        case TrendPeriod::Hour: return "hour";
        case TrendPeriod::Day: return "day";
        case TrendPeriod::Week: return "week";
    }
    return "hour";
}

nlohmann::json CacheTrend::toJson() const {
    nlohmann::json j;
    j["period"] = toString(period);
    j["timestamps"] = timestamps;
    j["metrics"] = nlohmann::json::array();
    for (const auto& m : metrics) {
        j["metrics"].push_back(m.toJson());
    }
    j["predictions"] = nlohmann::json::array();
    for (const auto& p : predictions) {
        j["predictions"].push_back({
            {"step", p.step},
            {"hitRatio", p.hitRatio},
            {"memoryUtilization", p.memoryUtilization},
            {"totalResponseTime", p.totalResponseTime}
        });
    }
    return j;
}

CacheTrend CacheTrend::fromJson(const nlohmann::json& j) {
    CacheTrend t;
    std::string period = j.value("period", std::string("hour"));
    t.period = period == "day" ? TrendPeriod::Day : (period == "week" ? TrendPeriod::Week : TrendPeriod::Hour);
    if (j.contains("timestamps")) {
        t.timestamps = j["timestamps"].get<std::vector<int64_t>>();
    }
    if (j.contains("metrics")) {
        for (const auto& m : j["metrics"]) {
            t.metrics.push_back(CacheMetrics::fromJson(m));
        }
    }
    if (j.contains("predictions")) {
        for (const auto& p : j["predictions"]) {
            MetricForecast f;
            f.step = p.value("step", 0);
            f.hitRatio = p.value("hitRatio", 0.0);
            f.memoryUtilization = p.value("memoryUtilization", 0.0);
            f.totalResponseTime = p.value("totalResponseTime", 0.0);
            t.predictions.push_back(f);
        }
    }
    return t;
}

std::string toString(RecommendationType type) {
    switch (type) {
        case RecommendationType::CacheSize: return "cache_size";
        case RecommendationType::EvictionPolicy: return "eviction_policy";
        case RecommendationType::PrefetchStrategy: return "prefetch_strategy";
        case RecommendationType::Compression: return "compression";
        case RecommendationType::TtlAdjustment: return "ttl_adjustment";
    }
    return "cache_size";
}

nlohmann::json OptimizationRecommendation::toJson() const {
    return {
        {"id", id},
        {"type", toString(type)},
        {"priority", priority},
        {"description", description},
        {"expectedImprovement", expectedImprovement},
        {"implementation", implementation},
        {"impactScore", impactScore}
    };
}

nlohmann::json AlertThresholds::toJson() const {
    return {
        {"hitRatio", hitRatio},
        {"hitRatioHigh", hitRatioHigh},
        {"memoryUtilization", memoryUtilization},
        {"memoryUtilizationCritical", memoryUtilizationCritical},
        {"averageResponseTime", averageResponseTime},
        {"averageResponseTimeHigh", averageResponseTimeHigh},
        {"evictionRate", evictionRate},
        {"evictionRateHigh", evictionRateHigh},
        {"errorRate", errorRate},
        {"errorRateHigh", errorRateHigh}
    };
}

AlertThresholds AlertThresholds::fromJson(const nlohmann::json& j) {
    AlertThresholds t;
    t.hitRatio = j.value("hitRatio", t.hitRatio);
    t.hitRatioHigh = j.value("hitRatioHigh", t.hitRatioHigh);
    t.memoryUtilization = j.value("memoryUtilization", t.memoryUtilization);
    t.memoryUtilizationCritical = j.value("memoryUtilizationCritical", t.memoryUtilizationCritical);
    t.averageResponseTime = j.value("averageResponseTime", t.averageResponseTime);
    t.averageResponseTimeHigh = j.value("averageResponseTimeHigh", t.averageResponseTimeHigh);
    t.evictionRate = j.value("evictionRate", t.evictionRate);
    t.evictionRateHigh = j.value("evictionRateHigh", t.evictionRateHigh);
    t.errorRate = j.value("errorRate", t.errorRate);
    t.errorRateHigh = j.value("errorRateHigh", t.errorRateHigh);
    return t;
}

nlohmann::json AnalyticsReport::toJson() const {
    nlohmann::json j;
    j["metrics"] = metrics.toJson();
    j["insights"] = insights;
    j["alerts"] = nlohmann::json::array();
    for (const auto& a : alerts) {
        j["alerts"].push_back(a.toJson());
    }
    j["recommendations"] = nlohmann::json::array();
    for (const auto& r : recommendations) {
        j["recommendations"].push_back(r.toJson());
    }
    j["efficiency"] = {
        {"cacheEfficiency", efficiency.cacheEfficiency},
        {"networkEfficiency", efficiency.networkEfficiency},
        {"memoryEfficiency", efficiency.memoryEfficiency},
        {"overallScore", efficiency.overallScore}
    };
    return j;
}

} // namespace telemetry
} // namespace core
} // namespace cachepilot

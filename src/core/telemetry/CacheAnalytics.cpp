#include "core/telemetry/CacheAnalytics.hpp"
#include "core/telemetry/Forecast.hpp"
#include "core/common/Hash.hpp"
#include "core/common/Logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <mutex>

namespace cachepilot {
namespace core {
namespace telemetry {

namespace {

constexpr double EMA_ALPHA = 0.1;
constexpr size_t DISK_USAGE_COMPRESSION_LIMIT = 100 * 1024 * 1024;

const char* KEY_METRICS = "cache_analytics_metrics";
const char* KEY_EVENTS = "cache_analytics_events";
const char* KEY_ALERTS = "cache_analytics_alerts";
const char* KEY_TRENDS = "cache_analytics_trends";
const char* KEY_CONFIG = "cache_analytics_config";

struct TrendBucket {
    TrendPeriod period;
    int64_t bucketMs;
    size_t maxPoints;
};

const TrendBucket TREND_BUCKETS[] = {
    {TrendPeriod::Hour, common::MS_PER_HOUR, 24},
    {TrendPeriod::Day, common::MS_PER_DAY, 30},
    {TrendPeriod::Week, common::MS_PER_WEEK, 12},
};

} // namespace

struct CacheAnalytics::Impl {
    TelemetryConfig config;
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<IMetricsSink> sink;
    std::shared_ptr<thread::Scheduler> scheduler;
    std::shared_ptr<spdlog::logger> logger;
    TelemetrySources sources;

    mutable std::mutex mutex; // Единственный писатель для всех структур ниже
    CacheMetrics metrics;
    size_t eventBytesServed = 0;
    size_t eventBytesDownloaded = 0;
    std::deque<CacheEvent> events;
    std::vector<PerformanceAlert> alerts;
    std::map<TrendPeriod, CacheTrend> trends;
    CacheMetrics lastWindowMetrics;
    std::optional<thread::Scheduler::TaskId> monitoringTask;
    size_t tickCount = 0;

    Impl(const TelemetryConfig& cfg, std::shared_ptr<common::Clock> clk,
         std::shared_ptr<IKeyValueStore> kv, std::shared_ptr<IMetricsSink> ms,
         std::shared_ptr<thread::Scheduler> sch)
        : config(cfg), clock(std::move(clk)), store(std::move(kv)), sink(std::move(ms)),
          scheduler(std::move(sch)), logger(common::getLogger("analytics")) {
        if (!clock) {
            clock = std::make_shared<common::SystemClock>();
        }
    }

    // Под mutex
    void appendEvent(CacheEvent&& event) {
        events.push_back(std::move(event));
        if (events.size() > config.maxEventsHistory) {
            size_t keep = static_cast<size_t>(std::floor(static_cast<double>(config.maxEventsHistory) * 0.8));
            while (events.size() > keep) {
                events.pop_front();
            }
        }
    }

    // Под mutex
    void updateMetricsFromEvent(const CacheEvent& event) {
        ++metrics.totalRequests;
        switch (event.type) {
            case EventType::Hit:
                ++metrics.cacheHits;
                metrics.averageHitTime = metrics.averageHitTime * (1.0 - EMA_ALPHA) + event.duration * EMA_ALPHA;
                if (event.size) {
                    eventBytesServed += *event.size;
                    metrics.bytesServedFromCache += *event.size;
                }
                break;
            case EventType::Miss:
                ++metrics.cacheMisses;
                metrics.averageMissTime = metrics.averageMissTime * (1.0 - EMA_ALPHA) + event.duration * EMA_ALPHA;
                if (event.size) {
                    eventBytesDownloaded += *event.size;
                    metrics.bytesDownloaded += *event.size;
                }
                break;
            case EventType::Error:
                ++metrics.errorCount;
                break;
            case EventType::Eviction:
            case EventType::Prefetch:
                break;
        }
        metrics.lastUpdate = event.timestamp;
        metrics.recompute();
    }

    // Снимки источников берутся без блокировки, затем сводятся под mutex
    CacheMetrics collectMetrics() {
        TelemetrySources src;
        {
            std::lock_guard<std::mutex> lock(mutex);
            src = sources;
        }
        std::optional<TierStatistics> tierStats;
        std::optional<AssetMetrics> assetStats;
        std::optional<ImageStats> imageStats;
        std::vector<MemoryPoolInfo> pools;
        std::optional<double> prefetch;
        if (src.tier) tierStats = src.tier->getStatistics();
        if (src.assets) assetStats = src.assets->getMetrics();
        if (src.images) imageStats = src.images->getStats();
        if (src.pools) pools = src.pools->getPools();
        if (src.prefetchAccuracy) prefetch = src.prefetchAccuracy();

        CacheMetrics snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            size_t imageSavings = 0;
            if (tierStats) {
                metrics.memoryUsage = tierStats->memoryUsage;
                metrics.memoryUtilization = tierStats->usagePercentage;
                metrics.diskUsage = tierStats->diskUsage;
                metrics.compressionRatio = tierStats->compressionRatio;
                metrics.evictionRate = static_cast<double>(tierStats->evictionCount) /
                                       static_cast<double>(std::max<uint64_t>(metrics.totalRequests, 1));
            }
            if (!pools.empty()) {
                size_t used = 0, capacity = 0;
                double fragmentation = 0.0;
                for (const auto& pool : pools) {
                    used += pool.used;
                    capacity += pool.capacity;
                    fragmentation += pool.fragmentation;
                }
                if (capacity > 0) {
                    metrics.memoryUtilization = static_cast<double>(used) / static_cast<double>(capacity);
                }
                metrics.memoryFragmentation = fragmentation / static_cast<double>(pools.size());
            }
            if (imageStats && imageStats->totalImages > 0) {
                metrics.diskUsage += imageStats->compressedBytes;
                metrics.compressionRatio = imageStats->compressionRatio;
                if (imageStats->originalBytes > imageStats->compressedBytes) {
                    imageSavings = imageStats->originalBytes - imageStats->compressedBytes;
                }
            }
            metrics.bytesServedFromCache = eventBytesServed;
            metrics.bytesDownloaded = eventBytesDownloaded + (assetStats ? assetStats->bytesDownloaded : 0);
            metrics.networkSavings = eventBytesServed + (assetStats ? assetStats->bytesServed : 0) + imageSavings;
            if (prefetch) {
                metrics.prefetchAccuracy = *prefetch;
            }
            metrics.lastUpdate = clock->nowMs();
            metrics.recompute();
            snapshot = metrics;
        }

        if (sink) {
            sink->recordMetric("cache_performance_snapshot", snapshot.hitRatio * 100.0, snapshot.lastUpdate, "cache", {
                {"hitRatio", snapshot.hitRatio},
                {"memoryUtilization", snapshot.memoryUtilization},
                {"responseTime", snapshot.totalResponseTime},
                {"networkSavings", snapshot.networkSavings}
            });
        }
        return snapshot;
    }

    void analyzePerformance() {
        std::vector<CacheEvent> window;
        {
            std::lock_guard<std::mutex> lock(mutex);
            int64_t cutoff = clock->nowMs() - config.analysisWindowMs;
            for (const auto& e : events) {
                if (e.timestamp >= cutoff) {
                    window.push_back(e);
                }
            }
        }
        if (window.empty()) {
            return;
        }
        CacheMetrics recent = CacheAnalytics::calculateMetricsFromEvents(window);
        auto insights = CacheAnalytics::generatePerformanceInsights(recent);
        auto recommendations = CacheAnalytics::generateOptimizationRecommendations(recent);
        for (const auto& insight : insights) {
            logger->info("CacheAnalytics: {}", insight);
        }
        if (!recommendations.empty()) {
            logger->info("CacheAnalytics: {} рекомендаций, лучшая: {} ({})",
                         recommendations.size(), toString(recommendations.front().type),
                         recommendations.front().impactScore);
        }
        std::lock_guard<std::mutex> lock(mutex);
        lastWindowMetrics = recent;
    }

    void updateTrends() {
        std::lock_guard<std::mutex> lock(mutex);
        int64_t now = clock->nowMs();
        for (const auto& window : TREND_BUCKETS) {
            CacheTrend& trend = trends[window.period];
            trend.period = window.period;
            int64_t bucket = (now / window.bucketMs) * window.bucketMs;
            if (!trend.timestamps.empty() && bucket <= trend.timestamps.back()) {
                continue;
            }
            trend.timestamps.push_back(bucket);
            trend.metrics.push_back(metrics);
            if (trend.metrics.size() > window.maxPoints) {
                size_t drop = trend.metrics.size() - window.maxPoints;
                trend.metrics.erase(trend.metrics.begin(), trend.metrics.begin() + static_cast<std::ptrdiff_t>(drop));
                trend.timestamps.erase(trend.timestamps.begin(), trend.timestamps.begin() + static_cast<std::ptrdiff_t>(drop));
            }
            trend.predictions = forecastTrend(trend.metrics);
        }
    }

    // Под mutex
    bool hasActiveAlert(AlertType type) const {
        return std::any_of(alerts.begin(), alerts.end(), [type](const PerformanceAlert& a) {
            return a.type == type && !a.acknowledged;
        });
    }

    // Под mutex
    void pushAlert(PerformanceAlert&& alert) {
        logger->warn("CacheAnalytics: алерт [{}] {}: {}", toString(alert.severity), toString(alert.type), alert.message);
        alerts.push_back(std::move(alert));
        while (alerts.size() > config.maxAlerts) {
            auto victim = std::find_if(alerts.begin(), alerts.end(), [](const PerformanceAlert& a) { return a.acknowledged; });
            alerts.erase(victim != alerts.end() ? victim : alerts.begin());
        }
    }

    std::vector<PerformanceAlert> buildAlerts(const CacheMetrics& m) const {
        const AlertThresholds& t = config.thresholds;
        int64_t now = clock->nowMs();
        std::vector<PerformanceAlert> result;
        auto make = [now](AlertType type, Severity severity, std::string message,
                          std::map<std::string, double> values, std::vector<std::string> actions) {
            PerformanceAlert a;
            a.id = common::generateId("alert_" + toString(type));
            a.type = type;
            a.severity = severity;
            a.message = std::move(message);
            a.metrics = std::move(values);
            a.timestamp = now;
            a.actions = std::move(actions);
            return a;
        };

        if (m.hitRatio < t.hitRatio) {
            result.push_back(make(AlertType::HighMissRate,
                m.hitRatio < t.hitRatioHigh ? Severity::High : Severity::Medium,
                fmt::format("Cache hit ratio is {:.1f}%, below threshold of {:.1f}%", m.hitRatio * 100.0, t.hitRatio * 100.0),
                {{"hitRatio", m.hitRatio}},
                {"Increase cache size", "Improve prefetch strategy", "Analyze cache keys for patterns"}));
        }
        if (m.memoryUtilization > t.memoryUtilization) {
            result.push_back(make(AlertType::MemoryPressure,
                m.memoryUtilization > t.memoryUtilizationCritical ? Severity::Critical : Severity::High,
                fmt::format("Memory utilization is {:.1f}%, exceeding threshold", m.memoryUtilization * 100.0),
                {{"memoryUtilization", m.memoryUtilization}},
                {"Implement more aggressive eviction", "Increase memory allocation", "Enable compression"}));
        }
        if (m.totalResponseTime > t.averageResponseTime) {
            result.push_back(make(AlertType::PerformanceDegradation,
                m.totalResponseTime > t.averageResponseTimeHigh ? Severity::High : Severity::Medium,
                fmt::format("Average response time is {:.0f}ms, exceeding threshold", m.totalResponseTime),
                {{"responseTime", m.totalResponseTime}},
                {"Optimize cache lookup performance", "Check network connectivity", "Review database query performance"}));
        }
        if (m.evictionRate > t.evictionRate) {
            result.push_back(make(AlertType::EvictionPressure,
                m.evictionRate > t.evictionRateHigh ? Severity::High : Severity::Medium,
                fmt::format("Eviction rate is {:.1f}%, exceeding threshold of {:.1f}%", m.evictionRate * 100.0, t.evictionRate * 100.0),
                {{"evictionRate", m.evictionRate}},
                {"Increase cache size", "Review TTL settings"}));
        }
        if (m.errorRate > t.errorRate) {
            result.push_back(make(AlertType::NetworkIssues,
                m.errorRate > t.errorRateHigh ? Severity::High : Severity::Medium,
                fmt::format("Error rate is {:.1f}%, exceeding threshold of {:.1f}%", m.errorRate * 100.0, t.errorRate * 100.0),
                {{"errorRate", m.errorRate}},
                {"Check network connectivity", "Inspect failing tiers"}));
        }
        return result;
    }

    void saveKey(const std::string& key, const nlohmann::json& value) {
        if (!store) {
            return;
        }
        try {
            store->set(key, value.dump());
        } catch (const std::exception& e) {
            logger->error("CacheAnalytics: ошибка сохранения {}: {}", key, e.what());
        }
    }

    nlohmann::json alertsJson() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& a : alerts) {
            arr.push_back(a.toJson());
        }
        return arr;
    }

    void persistAlerts() {
        nlohmann::json snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot = alertsJson();
        }
        saveKey(KEY_ALERTS, snapshot);
    }
};

CacheAnalytics::CacheAnalytics(const TelemetryConfig& config,
                               std::shared_ptr<common::Clock> clock,
                               std::shared_ptr<IKeyValueStore> store,
                               std::shared_ptr<IMetricsSink> sink,
                               std::shared_ptr<thread::Scheduler> scheduler)
    : pImpl(std::make_unique<Impl>(config, std::move(clock), std::move(store), std::move(sink), std::move(scheduler))) {
    pImpl->logger->info("CacheAnalytics создан: maxEventsHistory={}, interval={} мс",
                        config.maxEventsHistory, config.monitoringIntervalMs);
}

CacheAnalytics::~CacheAnalytics() {
    stopMonitoring();
}

void CacheAnalytics::setSources(const TelemetrySources& sources) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->sources = sources;
}

bool CacheAnalytics::loadStoredData() {
    if (!pImpl->store) {
        return false;
    }
    try {
        auto stored = pImpl->store->multiGet({KEY_METRICS, KEY_EVENTS, KEY_ALERTS, KEY_TRENDS, KEY_CONFIG});
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [key, value] : stored) {
            if (!value) {
                continue;
            }
            nlohmann::json j = nlohmann::json::parse(*value, nullptr, false);
            if (j.is_discarded()) {
                pImpl->logger->warn("CacheAnalytics: повреждены данные {}", key);
                continue;
            }
            if (key == KEY_METRICS) {
                pImpl->metrics = CacheMetrics::fromJson(j);
                pImpl->eventBytesServed = pImpl->metrics.bytesServedFromCache;
                pImpl->eventBytesDownloaded = pImpl->metrics.bytesDownloaded;
            } else if (key == KEY_EVENTS) {
                pImpl->events.clear();
                for (const auto& e : j) {
                    pImpl->appendEvent(CacheEvent::fromJson(e));
                }
            } else if (key == KEY_ALERTS) {
                pImpl->alerts.clear();
                for (const auto& a : j) {
                    pImpl->alerts.push_back(PerformanceAlert::fromJson(a));
                }
            } else if (key == KEY_TRENDS) {
                pImpl->trends.clear();
                for (const auto& t : j) {
                    CacheTrend trend = CacheTrend::fromJson(t);
                    pImpl->trends[trend.period] = trend;
                }
            } else if (key == KEY_CONFIG && j.contains("alertThresholds")) {
                AlertThresholds thresholds = AlertThresholds::fromJson(j["alertThresholds"]);
                if (thresholds.validate()) {
                    pImpl->config.thresholds = thresholds;
                }
            }
        }
        pImpl->logger->info("CacheAnalytics: загружено событий {}, алертов {}", pImpl->events.size(), pImpl->alerts.size());
        return true;
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheAnalytics: ошибка загрузки данных: {}", e.what());
        return false;
    }
}

void CacheAnalytics::recordEvent(CacheEvent event) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (event.id.empty()) {
        event.id = common::generateId("evt");
    }
    if (event.timestamp == 0) {
        event.timestamp = pImpl->clock->nowMs();
    }
    pImpl->updateMetricsFromEvent(event);
    pImpl->appendEvent(std::move(event));
}

bool CacheAnalytics::startMonitoring(int64_t intervalMs) {
    if (!pImpl->scheduler) {
        pImpl->logger->warn("CacheAnalytics: мониторинг без планировщика невозможен");
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->monitoringTask) {
        return true;
    }
    pImpl->monitoringTask = pImpl->scheduler->scheduleEvery(intervalMs, [this]() { runMonitoringCycle(); }, "analytics_monitoring");
    pImpl->logger->info("CacheAnalytics: мониторинг запущен, интервал {} мс", intervalMs);
    return true;
}

void CacheAnalytics::stopMonitoring() {
    std::optional<thread::Scheduler::TaskId> task;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        task.swap(pImpl->monitoringTask);
    }
    if (task && pImpl->scheduler) {
        pImpl->scheduler->cancel(*task);
        pImpl->logger->info("CacheAnalytics: мониторинг остановлен");
    }
}

bool CacheAnalytics::isMonitoring() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->monitoringTask.has_value();
}

void CacheAnalytics::runMonitoringCycle() {
    try {
        pImpl->collectMetrics();
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheAnalytics: ошибка сбора метрик: {}", e.what());
    }
    try {
        pImpl->analyzePerformance();
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheAnalytics: ошибка анализа: {}", e.what());
    }
    try {
        pImpl->updateTrends();
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheAnalytics: ошибка обновления трендов: {}", e.what());
    }
    try {
        evaluateAlerts();
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheAnalytics: ошибка проверки алертов: {}", e.what());
    }

    bool persist;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->tickCount;
        persist = pImpl->tickCount % pImpl->config.persistEveryNTicks == 0;
    }
    if (persist) {
        persistData();
    }
}

CacheMetrics CacheAnalytics::collectMetrics() {
    return pImpl->collectMetrics();
}

size_t CacheAnalytics::evaluateAlerts() {
    return evaluateAlerts(getCurrentMetrics());
}

size_t CacheAnalytics::evaluateAlerts(const CacheMetrics& metrics) {
    size_t added = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto& alert : pImpl->buildAlerts(metrics)) {
            if (pImpl->hasActiveAlert(alert.type)) {
                continue;
            }
            pImpl->pushAlert(std::move(alert));
            ++added;
        }
    }
    if (added > 0) {
        pImpl->persistAlerts();
    }
    return added;
}

CacheMetrics CacheAnalytics::getCurrentMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->metrics;
}

std::vector<CacheEvent> CacheAnalytics::getRecentEvents(size_t count) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    size_t start = pImpl->events.size() > count ? pImpl->events.size() - count : 0;
    return std::vector<CacheEvent>(pImpl->events.begin() + static_cast<std::ptrdiff_t>(start), pImpl->events.end());
}

std::vector<CacheEvent> CacheAnalytics::getEventsInWindow(int64_t windowMs) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    int64_t cutoff = pImpl->clock->nowMs() - windowMs;
    std::vector<CacheEvent> result;
    for (const auto& e : pImpl->events) {
        if (e.timestamp >= cutoff) {
            result.push_back(e);
        }
    }
    return result;
}

size_t CacheAnalytics::getEventCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->events.size();
}

std::vector<PerformanceAlert> CacheAnalytics::getActiveAlerts() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<PerformanceAlert> result;
    for (const auto& a : pImpl->alerts) {
        if (!a.acknowledged) {
            result.push_back(a);
        }
    }
    return result;
}

bool CacheAnalytics::acknowledgeAlert(const std::string& alertId) {
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto& a : pImpl->alerts) {
            if (a.id == alertId) {
                a.acknowledged = true;
                found = true;
                break;
            }
        }
    }
    if (found) {
        pImpl->persistAlerts();
    }
    return found;
}

std::optional<CacheTrend> CacheAnalytics::getTrend(TrendPeriod period) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->trends.find(period);
    if (it == pImpl->trends.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<OptimizationRecommendation> CacheAnalytics::generateOptimizationRecommendations(const CacheMetrics& metrics) {
    std::vector<OptimizationRecommendation> result;
    auto make = [](RecommendationType type, const char* priority, const char* description,
                   const char* improvement, const char* implementation, double impact) {
        OptimizationRecommendation r;
        r.id = common::generateId("rec_" + toString(type));
        r.type = type;
        r.priority = priority;
        r.description = description;
        r.expectedImprovement = improvement;
        r.implementation = implementation;
        r.impactScore = impact;
        return r;
    };

    if (metrics.evictionRate > 0.1) {
        result.push_back(make(RecommendationType::CacheSize, "high",
            "High eviction rate indicates insufficient cache size",
            "Reduce evictions by 50-70%, improve hit ratio by 10-20%",
            "Increase maxMemorySize of the memory tier", 8.5));
    }
    if (metrics.compressionRatio > 0.8 && metrics.diskUsage > DISK_USAGE_COMPRESSION_LIMIT) {
        result.push_back(make(RecommendationType::Compression, "medium",
            "Low compression ratio with high disk usage",
            "Reduce storage usage by 20-40%",
            "Enable aggressive compression for large assets", 6.5));
    }
    if (metrics.prefetchAccuracy < 0.6) {
        result.push_back(make(RecommendationType::PrefetchStrategy, "medium",
            "Low prefetch accuracy indicates suboptimal prediction",
            "Improve cache hit ratio by 15-25%",
            "Refine access patterns and prediction thresholds", 7.0));
    }
    double hitMissRatio = metrics.averageHitTime / std::max(metrics.averageMissTime, 1.0);
    if (hitMissRatio > 0.8) {
        result.push_back(make(RecommendationType::TtlAdjustment, "low",
            "Hit times are relatively high compared to miss times",
            "Reduce hit times by 10-15%",
            "Decrease TTL for frequently accessed items", 4.5));
    }

    std::stable_sort(result.begin(), result.end(), [](const OptimizationRecommendation& a, const OptimizationRecommendation& b) {
        return a.impactScore > b.impactScore;
    });
    return result;
}

std::vector<std::string> CacheAnalytics::generatePerformanceInsights(const CacheMetrics& metrics) {
    std::vector<std::string> insights;
    if (metrics.hitRatio < 0.5) {
        insights.emplace_back("Low cache hit ratio detected. Consider increasing cache size or improving prefetch strategy.");
    } else if (metrics.hitRatio > 0.9) {
        insights.emplace_back("Excellent cache hit ratio. Current strategy is performing very well.");
    }
    if (metrics.totalResponseTime > 500.0) {
        insights.emplace_back("High response times detected. Consider optimizing cache lookup or network performance.");
    }
    if (metrics.memoryUtilization > 0.9) {
        insights.emplace_back("High memory utilization. Consider implementing more aggressive eviction policies.");
    }
    double networkEfficiency = static_cast<double>(metrics.networkSavings) /
                               static_cast<double>(std::max<size_t>(metrics.bytesDownloaded, 1));
    if (networkEfficiency < 0.3) {
        insights.emplace_back("Low network efficiency. Consider enabling compression and optimizing asset sizes.");
    }
    return insights;
}

CacheMetrics CacheAnalytics::calculateMetricsFromEvents(const std::vector<CacheEvent>& events) {
    CacheMetrics m;
    for (const auto& e : events) {
        ++m.totalRequests;
        if (e.type == EventType::Hit) {
            ++m.cacheHits;
            m.averageHitTime = (m.averageHitTime * static_cast<double>(m.cacheHits - 1) + e.duration) /
                               static_cast<double>(m.cacheHits);
        } else if (e.type == EventType::Miss) {
            ++m.cacheMisses;
            m.averageMissTime = (m.averageMissTime * static_cast<double>(m.cacheMisses - 1) + e.duration) /
                                static_cast<double>(m.cacheMisses);
        } else if (e.type == EventType::Error) {
            ++m.errorCount;
        }
        if (e.size) {
            if (e.type == EventType::Hit) {
                m.bytesServedFromCache += *e.size;
            } else {
                m.bytesDownloaded += *e.size;
            }
        }
    }
    m.recompute();
    return m;
}

std::vector<OptimizationRecommendation> CacheAnalytics::getOptimizationRecommendations() const {
    return generateOptimizationRecommendations(getCurrentMetrics());
}

AnalyticsReport CacheAnalytics::getPerformanceReport() const {
    AnalyticsReport report;
    report.metrics = getCurrentMetrics();
    report.insights = generatePerformanceInsights(report.metrics);
    report.alerts = getActiveAlerts();
    report.recommendations = generateOptimizationRecommendations(report.metrics);

    double cacheEfficiency = report.metrics.hitRatio;
    double networkEfficiency = static_cast<double>(report.metrics.networkSavings) /
                               static_cast<double>(std::max<size_t>(report.metrics.bytesDownloaded, 1));
    double memoryEfficiency = 1.0 - report.metrics.memoryUtilization;
    double overall = (cacheEfficiency * 0.4 + networkEfficiency * 0.3 + memoryEfficiency * 0.3) * 100.0;

    report.efficiency.cacheEfficiency = cacheEfficiency * 100.0;
    report.efficiency.networkEfficiency = networkEfficiency * 100.0;
    report.efficiency.memoryEfficiency = memoryEfficiency * 100.0;
    report.efficiency.overallScore = static_cast<int>(std::lround(overall));
    return report;
}

bool CacheAnalytics::updateAlertThresholds(const AlertThresholds& thresholds) {
    if (!thresholds.validate()) {
        pImpl->logger->warn("CacheAnalytics: отклонены некорректные пороги алертов");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->config.thresholds = thresholds;
    }
    pImpl->saveKey(KEY_CONFIG, {{"alertThresholds", thresholds.toJson()}});
    return true;
}

AlertThresholds CacheAnalytics::getAlertThresholds() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config.thresholds;
}

nlohmann::json CacheAnalytics::exportAnalyticsData() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    nlohmann::json j;
    j["metrics"] = pImpl->metrics.toJson();
    j["events"] = nlohmann::json::array();
    for (const auto& e : pImpl->events) {
        j["events"].push_back(e.toJson());
    }
    j["alerts"] = pImpl->alertsJson();
    j["trends"] = nlohmann::json::array();
    for (const auto& [period, trend] : pImpl->trends) {
        j["trends"].push_back(trend.toJson());
    }
    j["recentWindow"] = pImpl->lastWindowMetrics.toJson();
    return j;
}

void CacheAnalytics::clearAnalyticsData() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->metrics = CacheMetrics();
        pImpl->eventBytesServed = 0;
        pImpl->eventBytesDownloaded = 0;
        pImpl->events.clear();
        pImpl->alerts.clear();
        pImpl->trends.clear();
        pImpl->lastWindowMetrics = CacheMetrics();
    }
    persistData();
    pImpl->logger->info("CacheAnalytics: данные аналитики очищены");
}

void CacheAnalytics::persistData() {
    if (!pImpl->store) {
        return;
    }
    nlohmann::json metrics, events, alerts, trends, config;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        metrics = pImpl->metrics.toJson();
        events = nlohmann::json::array();
        for (const auto& e : pImpl->events) {
            events.push_back(e.toJson());
        }
        alerts = pImpl->alertsJson();
        trends = nlohmann::json::array();
        for (const auto& [period, trend] : pImpl->trends) {
            trends.push_back(trend.toJson());
        }
        config = {{"alertThresholds", pImpl->config.thresholds.toJson()}};
    }
    pImpl->saveKey(KEY_METRICS, metrics);
    pImpl->saveKey(KEY_EVENTS, events);
    pImpl->saveKey(KEY_ALERTS, alerts);
    pImpl->saveKey(KEY_TRENDS, trends);
    pImpl->saveKey(KEY_CONFIG, config);
}

} // namespace telemetry
} // namespace core
} // namespace cachepilot

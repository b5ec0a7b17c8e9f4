#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include "core/cache/tier/MemoryCacheTier.hpp"
#include "core/common/Clock.hpp"
#include "core/storage/MemoryKeyValueStore.hpp"
#include "core/telemetry/CacheAnalytics.hpp"
#include "core/thread/Scheduler.hpp"

using namespace cachepilot::core;
using namespace cachepilot::core::telemetry;
using cachepilot::core::common::ManualClock;

namespace {

class CountingSink : public IMetricsSink {
public:
    void recordMetric(const std::string& name, double, int64_t, const std::string&, const nlohmann::json&) override {
        if (name == "cache_performance_snapshot") {
            snapshots++;
        }
    }
    std::atomic<int> snapshots{0};
};

CacheEvent makeEvent(EventType type, double duration = 0.0, size_t size = 0) {
    CacheEvent e;
    e.type = type;
    e.key = "pet:1";
    e.duration = duration;
    if (size > 0) {
        e.size = size;
    }
    return e;
}

void recordHitsAndMisses(CacheAnalytics& analytics, int hits, int misses) {
    for (int i = 0; i < hits; ++i) analytics.recordEvent(makeEvent(EventType::Hit, 0.0, 100));
    for (int i = 0; i < misses; ++i) analytics.recordEvent(makeEvent(EventType::Miss, 0.0, 200));
}

} // namespace

void smokeTestCacheAnalytics() {
    std::cout << "Testing CacheAnalytics event recording...\n";

    auto clock = std::make_shared<ManualClock>();
    CacheAnalytics analytics(TelemetryConfig{}, clock);

    analytics.recordEvent(makeEvent(EventType::Hit, 10.0, 512));
    analytics.recordEvent(makeEvent(EventType::Miss, 100.0, 1024));
    analytics.recordEvent(makeEvent(EventType::Error));

    auto metrics = analytics.getCurrentMetrics();
    assert(metrics.totalRequests == 3);
    assert(metrics.cacheHits == 1);
    assert(metrics.cacheMisses == 1);
    assert(metrics.errorCount == 1);
    assert(metrics.bytesServedFromCache == 512);
    assert(metrics.bytesDownloaded == 1024);
    assert(metrics.averageHitTime > 0.0);

    auto events = analytics.getRecentEvents(10);
    assert(events.size() == 3);
    assert(!events[0].id.empty());
    assert(events[0].timestamp == clock->nowMs());

    clock->advance(10 * common::MS_PER_MINUTE);
    analytics.recordEvent(makeEvent(EventType::Hit));
    assert(analytics.getEventsInWindow(common::MS_PER_MINUTE).size() == 1);

    std::cout << "[OK] CacheAnalytics smoke test\n";
}

void testCacheAnalyticsEventRing() {
    std::cout << "Testing CacheAnalytics event history bound...\n";

    auto clock = std::make_shared<ManualClock>();
    CacheAnalytics analytics(TelemetryConfig{}, clock);

    for (int i = 0; i < 1000; ++i) {
        analytics.recordEvent(makeEvent(EventType::Hit));
    }
    assert(analytics.getEventCount() == 1000);

    // Переполнение обрезает историю до 80%
    analytics.recordEvent(makeEvent(EventType::Miss));
    assert(analytics.getEventCount() == 800);
    assert(analytics.getRecentEvents(1)[0].type == EventType::Miss);
    // Счётчики не зависят от обрезки
    assert(analytics.getCurrentMetrics().totalRequests == 1001);

    std::cout << "[OK] CacheAnalytics event ring test\n";
}

void testCacheAnalyticsAlerts() {
    std::cout << "Testing CacheAnalytics alerts...\n";

    auto clock = std::make_shared<ManualClock>();
    CacheAnalytics analytics(TelemetryConfig{}, clock);
    recordHitsAndMisses(analytics, 4, 6);
    assert(analytics.getCurrentMetrics().hitRatio == 0.4);

    assert(analytics.evaluateAlerts() == 1);
    auto alerts = analytics.getActiveAlerts();
    assert(alerts.size() == 1);
    assert(alerts[0].type == AlertType::HighMissRate);
    assert(alerts[0].severity == Severity::High);
    assert(alerts[0].metrics.at("hitRatio") == 0.4);
    assert(!alerts[0].actions.empty());

    // Повтор не дублирует активный алерт
    assert(analytics.evaluateAlerts() == 0);

    assert(analytics.acknowledgeAlert(alerts[0].id));
    assert(!analytics.acknowledgeAlert("alert_unknown"));
    assert(analytics.getActiveAlerts().empty());

    // Остальные пороги
    CacheMetrics stressed;
    stressed.hitRatio = 0.9;
    stressed.memoryUtilization = 0.97;
    stressed.totalResponseTime = 600.0;
    stressed.evictionRate = 0.3;
    stressed.errorRate = 0.06;
    assert(analytics.evaluateAlerts(stressed) == 4);
    for (const auto& alert : analytics.getActiveAlerts()) {
        if (alert.type == AlertType::MemoryPressure) assert(alert.severity == Severity::Critical);
        if (alert.type == AlertType::PerformanceDegradation) assert(alert.severity == Severity::Medium);
        if (alert.type == AlertType::EvictionPressure) assert(alert.severity == Severity::High);
        if (alert.type == AlertType::NetworkIssues) assert(alert.severity == Severity::Medium);
    }

    // Пороги
    AlertThresholds broken;
    broken.hitRatio = 1.5;
    assert(!analytics.updateAlertThresholds(broken));
    AlertThresholds relaxed;
    relaxed.hitRatio = 0.3;
    relaxed.hitRatioHigh = 0.2;
    assert(analytics.updateAlertThresholds(relaxed));
    assert(analytics.getAlertThresholds().hitRatio == 0.3);

    std::cout << "[OK] CacheAnalytics alerts test\n";
}

void testCacheAnalyticsRecommendations() {
    std::cout << "Testing CacheAnalytics recommendations and insights...\n";

    CacheMetrics m;
    m.evictionRate = 0.2;
    m.prefetchAccuracy = 0.3;
    m.averageHitTime = 90.0;
    m.averageMissTime = 100.0;
    auto recs = CacheAnalytics::generateOptimizationRecommendations(m);
    assert(recs.size() == 3);
    assert(recs[0].type == RecommendationType::CacheSize);
    assert(recs[0].priority == "high");
    assert(recs[1].type == RecommendationType::PrefetchStrategy);
    assert(recs[2].type == RecommendationType::TtlAdjustment);
    for (size_t i = 1; i < recs.size(); ++i) {
        assert(recs[i - 1].impactScore >= recs[i].impactScore);
    }

    CacheMetrics healthy;
    healthy.prefetchAccuracy = 0.9;
    healthy.averageMissTime = 100.0;
    assert(CacheAnalytics::generateOptimizationRecommendations(healthy).empty());

    CacheMetrics poor;
    poor.hitRatio = 0.2;
    poor.totalResponseTime = 800.0;
    poor.memoryUtilization = 0.95;
    auto insights = CacheAnalytics::generatePerformanceInsights(poor);
    assert(insights.size() == 4);

    std::vector<CacheEvent> events = {
        makeEvent(EventType::Hit, 10.0, 100),
        makeEvent(EventType::Hit, 30.0, 100),
        makeEvent(EventType::Miss, 200.0, 400),
    };
    auto derived = CacheAnalytics::calculateMetricsFromEvents(events);
    assert(derived.totalRequests == 3);
    assert(derived.averageHitTime == 20.0);
    assert(derived.averageMissTime == 200.0);
    assert(derived.bytesServedFromCache == 200);
    assert(derived.bytesDownloaded == 400);

    std::cout << "[OK] CacheAnalytics recommendations test\n";
}

void testCacheAnalyticsMonitoringCycle() {
    std::cout << "Testing CacheAnalytics monitoring cycle and trends...\n";

    auto clock = std::make_shared<ManualClock>();
    auto sink = std::make_shared<CountingSink>();
    auto tier = std::make_shared<cache::MemoryCacheTier>(cache::CacheConfig{}, clock);
    tier->set("pet:1", {{"name", "Rex"}});

    CacheAnalytics analytics(TelemetryConfig{}, clock, nullptr, sink);
    TelemetrySources sources;
    sources.tier = tier;
    sources.prefetchAccuracy = []() { return 0.75; };
    analytics.setSources(sources);
    assert(!analytics.startMonitoring(1000)); // без планировщика

    recordHitsAndMisses(analytics, 8, 2);
    analytics.runMonitoringCycle();
    auto metrics = analytics.getCurrentMetrics();
    assert(metrics.memoryUsage > 0);
    assert(metrics.prefetchAccuracy == 0.75);
    assert(metrics.hitRatio == 0.8);
    assert(sink->snapshots == 1);

    auto hourly = analytics.getTrend(TrendPeriod::Hour);
    assert(hourly && hourly->metrics.size() == 1);
    assert(hourly->predictions.empty());

    // Повторный тик в той же корзине не добавляет точку
    analytics.runMonitoringCycle();
    assert(analytics.getTrend(TrendPeriod::Hour)->metrics.size() == 1);

    for (int i = 0; i < 3; ++i) {
        clock->advance(common::MS_PER_HOUR);
        analytics.runMonitoringCycle();
    }
    hourly = analytics.getTrend(TrendPeriod::Hour);
    assert(hourly->metrics.size() == 4);
    assert(hourly->predictions.size() == 3);

    auto report = analytics.getPerformanceReport();
    assert(report.efficiency.cacheEfficiency == 80.0);
    assert(report.efficiency.overallScore > 0);
    assert(report.toJson().contains("efficiency"));

    std::cout << "[OK] CacheAnalytics monitoring cycle test\n";
}

void testCacheAnalyticsScheduledMonitoring() {
    std::cout << "Testing CacheAnalytics scheduled monitoring...\n";

    auto scheduler = std::make_shared<thread::Scheduler>();
    scheduler->start();
    auto sink = std::make_shared<CountingSink>();
    CacheAnalytics analytics(TelemetryConfig{}, std::make_shared<common::SystemClock>(), nullptr, sink, scheduler);

    assert(analytics.startMonitoring(20));
    assert(analytics.startMonitoring(20)); // идемпотентно
    assert(scheduler->pendingCount() == 1);
    for (int i = 0; i < 200 && sink->snapshots < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(sink->snapshots >= 2);

    analytics.stopMonitoring();
    assert(!analytics.isMonitoring());
    assert(scheduler->pendingCount() == 0);
    scheduler->stop();

    std::cout << "[OK] CacheAnalytics scheduled monitoring test\n";
}

void testCacheAnalyticsPersistence() {
    std::cout << "Testing CacheAnalytics persistence...\n";

    auto clock = std::make_shared<ManualClock>();
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    {
        CacheAnalytics analytics(TelemetryConfig{}, clock, store);
        recordHitsAndMisses(analytics, 4, 6);
        assert(analytics.evaluateAlerts() == 1);
        analytics.persistData();
    }
    {
        CacheAnalytics analytics(TelemetryConfig{}, clock, store);
        assert(analytics.loadStoredData());
        assert(analytics.getCurrentMetrics().cacheHits == 4);
        assert(analytics.getEventCount() == 10);
        auto alerts = analytics.getActiveAlerts();
        assert(alerts.size() == 1 && alerts[0].type == AlertType::HighMissRate);

        auto exported = analytics.exportAnalyticsData();
        assert(exported["events"].size() == 10);

        analytics.clearAnalyticsData();
        assert(analytics.getEventCount() == 0);
        assert(analytics.getActiveAlerts().empty());
    }

    // Повреждённые данные пропускаются
    store->set("cache_analytics_events", "{broken");
    CacheAnalytics analytics(TelemetryConfig{}, clock, store);
    assert(analytics.loadStoredData());
    assert(analytics.getEventCount() == 0);

    CacheAnalytics detached(TelemetryConfig{}, clock);
    assert(!detached.loadStoredData());

    std::cout << "[OK] CacheAnalytics persistence test\n";
}

int main() {
    try {
        smokeTestCacheAnalytics();
        testCacheAnalyticsEventRing();
        testCacheAnalyticsAlerts();
        testCacheAnalyticsRecommendations();
        testCacheAnalyticsMonitoringCycle();
        testCacheAnalyticsScheduledMonitoring();
        testCacheAnalyticsPersistence();
        std::cout << "All CacheAnalytics tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheAnalytics test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

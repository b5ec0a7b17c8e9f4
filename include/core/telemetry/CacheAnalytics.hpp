#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/common/Clock.hpp"
#include "core/interfaces/Collaborators.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/interfaces/IKeyValueStore.hpp"
#include "core/telemetry/TelemetryTypes.hpp"
#include "core/thread/Scheduler.hpp"

namespace cachepilot {
namespace core {
namespace telemetry {

// Источники снимков для тика мониторинга. Любой может отсутствовать
struct TelemetrySources {
    std::shared_ptr<ICacheTier> tier;
    std::shared_ptr<IAssetFetcher> assets;
    std::shared_ptr<IImagePipeline> images;
    std::shared_ptr<IMemoryPoolManager> pools;
    std::function<double()> prefetchAccuracy;
};

// CacheAnalytics — события кэша, сводные метрики, алерты, тренды и прогноз
class CacheAnalytics {
public:
    CacheAnalytics(const TelemetryConfig& config,
                   std::shared_ptr<common::Clock> clock,
                   std::shared_ptr<IKeyValueStore> store = nullptr,
                   std::shared_ptr<IMetricsSink> sink = nullptr,
                   std::shared_ptr<thread::Scheduler> scheduler = nullptr); // Конструктор
    ~CacheAnalytics(); // Деструктор
    CacheAnalytics(const CacheAnalytics&) = delete;
    CacheAnalytics& operator=(const CacheAnalytics&) = delete;

    void setSources(const TelemetrySources& sources); // Подключить источники
    bool loadStoredData(); // Загрузить сохранённое состояние

    void recordEvent(CacheEvent event); // Записать событие
    bool startMonitoring(int64_t intervalMs = 10000); // Идемпотентно; false без планировщика
    void stopMonitoring();
    bool isMonitoring() const;
    void runMonitoringCycle(); // Один тик мониторинга
    CacheMetrics collectMetrics(); // Свести снимки источников в метрики

    size_t evaluateAlerts(); // Проверка порогов по текущим метрикам
    size_t evaluateAlerts(const CacheMetrics& metrics); // Кол-во новых алертов

    CacheMetrics getCurrentMetrics() const;
    std::vector<CacheEvent> getRecentEvents(size_t count = 50) const;
    std::vector<CacheEvent> getEventsInWindow(int64_t windowMs) const;
    size_t getEventCount() const;
    std::vector<PerformanceAlert> getActiveAlerts() const;
    bool acknowledgeAlert(const std::string& alertId);
    std::optional<CacheTrend> getTrend(TrendPeriod period) const;

    static std::vector<OptimizationRecommendation> generateOptimizationRecommendations(const CacheMetrics& metrics);
    static std::vector<std::string> generatePerformanceInsights(const CacheMetrics& metrics);
    static CacheMetrics calculateMetricsFromEvents(const std::vector<CacheEvent>& events);

    std::vector<OptimizationRecommendation> getOptimizationRecommendations() const;
    AnalyticsReport getPerformanceReport() const;

    bool updateAlertThresholds(const AlertThresholds& thresholds); // false, если пороги некорректны
    AlertThresholds getAlertThresholds() const;

    nlohmann::json exportAnalyticsData() const;
    void clearAnalyticsData();
    void persistData(); // Ошибки хранилища логируются
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace telemetry
} // namespace core
} // namespace cachepilot

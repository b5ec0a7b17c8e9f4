#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Clock.hpp"
#include "core/interfaces/Collaborators.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/orchestrator/OrchestratorTypes.hpp"
#include "core/prediction/PredictiveLoader.hpp"
#include "core/query/QueryOptimizer.hpp"
#include "core/telemetry/CacheAnalytics.hpp"
#include "core/thread/Scheduler.hpp"

namespace cachepilot {
namespace core {
namespace orchestrator {

// Компоненты под управлением оркестратора. Любой может отсутствовать
struct OrchestratorComponents {
    std::shared_ptr<ICacheTier> tier;
    std::shared_ptr<telemetry::CacheAnalytics> analytics;
    std::shared_ptr<prediction::PredictiveLoader> predictor;
    std::shared_ptr<query::QueryOptimizer> queries;
    std::shared_ptr<IAssetFetcher> assets;
    std::shared_ptr<IImagePipeline> images;
    std::shared_ptr<IMemoryPoolManager> pools;
};

/**
 * @brief CacheOrchestrator — единая точка get/set поверх цепочки тиров
 * @details Чтение идёт по цепочке память -> предзагрузка -> CDN -> запросы, затем fallback.
 * Каждый исход уходит в аналитику, записи обучают предсказатель. Периодическая
 * проверка здоровья сравнивает метрики с базой и запускает optimizePerformance.
 * get и set не бросают исключений.
 */
class CacheOrchestrator {
public:
    CacheOrchestrator(const OrchestratorConfig& config,
                      const OrchestratorComponents& components,
                      std::shared_ptr<common::Clock> clock,
                      std::shared_ptr<thread::Scheduler> scheduler = nullptr); // Конструктор
    ~CacheOrchestrator(); // Деструктор
    CacheOrchestrator(const CacheOrchestrator&) = delete;
    CacheOrchestrator& operator=(const CacheOrchestrator&) = delete;

    bool start(); // Проверка здоровья по таймеру; false без планировщика
    void stop();

    GetResult get(const std::string& key, const GetOptions& options = {});
    bool set(const std::string& key, const nlohmann::json& data, const SetOptions& options = {});
    bool remove(const std::string& key);

    std::vector<prediction::PredictionResult> prefetchForRoute(const std::string& route);
    void trackNavigation(const std::string& from, const std::string& to, double loadTimeMs);

    OptimizationResult optimizePerformance();
    HealthCheckResult runHealthCheck();
    PerformanceReport getPerformanceReport() const;

    // Делегаты компонентов
    nlohmann::json executeQuery(const std::string& sql, const nlohmann::json& params = nlohmann::json::array(),
                                const query::QueryOptions& options = {});
    std::future<nlohmann::json> batchQuery(const std::string& sql, const nlohmann::json& params = nlohmann::json::array());
    query::QueryAnalysis analyzeQuery(const std::string& sql) const;
    void recordUserAction(const std::string& action, const nlohmann::json& data, double loadTimeMs);
    std::vector<prediction::PredictionResult> generatePredictions(const std::string& route);
    cache::CacheMetrics getCurrentMetrics() const;
    std::vector<telemetry::PerformanceAlert> getActiveAlerts() const;
    bool acknowledgeAlert(const std::string& alertId);

    OrchestratorConfig getConfiguration() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace orchestrator
} // namespace core
} // namespace cachepilot

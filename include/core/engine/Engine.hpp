#pragma once

#include <memory>
#include "core/common/Clock.hpp"
#include "core/engine/EngineConfig.hpp"
#include "core/interfaces/Collaborators.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/interfaces/IKeyValueStore.hpp"
#include "core/orchestrator/CacheOrchestrator.hpp"
#include "core/prediction/PredictiveLoader.hpp"
#include "core/query/QueryOptimizer.hpp"
#include "core/telemetry/CacheAnalytics.hpp"
#include "core/thread/Scheduler.hpp"
#include "core/thread/ThreadPool.hpp"

namespace cachepilot {
namespace core {
namespace engine {

// Внешние зависимости. Пустые store/tier/clock создаются движком
struct EngineCollaborators {
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<ICacheTier> tier;
    std::shared_ptr<IDatabaseExecutor> database; // Без него QueryOptimizer не создаётся
    std::shared_ptr<IAssetFetcher> assets;
    std::shared_ptr<IImagePipeline> images;
    std::shared_ptr<IMemoryPoolManager> pools;
    std::shared_ptr<IMetricsSink> sink;
    prediction::DataLoader dataLoader;
};

/**
 * @brief Engine — корень композиции: строит компоненты из EngineConfig и управляет их циклами
 * @details Конструктор ничего не запускает. initialize() проверяет конфиг, поднимает
 * планировщик и пул, загружает сохранённое состояние и запускает таймеры.
 * shutdown() отменяет таймеры, сохраняет состояние и останавливает потоки.
 */
class Engine {
public:
    explicit Engine(const EngineConfig& config, const EngineCollaborators& collaborators = {}); // Конструктор
    ~Engine(); // Деструктор
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool initialize(); // false при некорректном конфиге или ошибке запуска
    void shutdown();
    bool isInitialized() const;

    std::shared_ptr<orchestrator::CacheOrchestrator> orchestrator() const;
    std::shared_ptr<telemetry::CacheAnalytics> analytics() const;
    std::shared_ptr<prediction::PredictiveLoader> predictor() const;
    std::shared_ptr<query::QueryOptimizer> queryOptimizer() const;
    std::shared_ptr<ICacheTier> tier() const;
    std::shared_ptr<IKeyValueStore> store() const;
    std::shared_ptr<thread::Scheduler> scheduler() const;

    EngineConfig getConfiguration() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace engine
} // namespace core
} // namespace cachepilot

#include "core/engine/Engine.hpp"
#include "core/cache/tier/MemoryCacheTier.hpp"
#include "core/common/Logging.hpp"
#include "core/storage/FileKeyValueStore.hpp"
#include "core/storage/MemoryKeyValueStore.hpp"
#include <mutex>
#include <stdexcept>

namespace cachepilot {
namespace core {
namespace engine {

struct Engine::Impl {
    EngineConfig config;
    EngineCollaborators collaborators;
    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex; // Сериализует initialize/shutdown
    bool initialized = false;

    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<ICacheTier> tier;
    std::shared_ptr<thread::Scheduler> scheduler;
    std::shared_ptr<thread::ThreadPool> pool;
    std::shared_ptr<telemetry::CacheAnalytics> analytics;
    std::shared_ptr<prediction::PredictiveLoader> predictor;
    std::shared_ptr<query::QueryOptimizer> queries;
    std::shared_ptr<orchestrator::CacheOrchestrator> orchestrator;

    Impl(const EngineConfig& cfg, const EngineCollaborators& collab)
        : config(cfg), collaborators(collab), logger(common::getLogger("engine")) {}

    void build() {
        clock = collaborators.clock ? collaborators.clock : std::make_shared<common::SystemClock>();
        store = collaborators.store;
        if (!store) {
            if (config.storagePath.empty()) {
                store = std::make_shared<storage::MemoryKeyValueStore>();
            } else {
                store = std::make_shared<storage::FileKeyValueStore>(config.storagePath);
            }
        }
        tier = collaborators.tier ? collaborators.tier
                                  : std::make_shared<cache::MemoryCacheTier>(config.tier, clock, store);

        scheduler = std::make_shared<thread::Scheduler>();
        scheduler->start();
        pool = std::make_shared<thread::ThreadPool>(config.threadPool);

        analytics = std::make_shared<telemetry::CacheAnalytics>(config.telemetry, clock, store,
                                                               collaborators.sink, scheduler);
        if (config.enablePrediction) {
            predictor = std::make_shared<prediction::PredictiveLoader>(config.predictor, clock, tier,
                                                                       collaborators.dataLoader, store,
                                                                       collaborators.sink, scheduler);
        }
        if (config.enableQueryOptimization && collaborators.database) {
            queries = std::make_shared<query::QueryOptimizer>(config.query, clock, collaborators.database, tier,
                                                              store, collaborators.sink, scheduler, pool);
        } else if (config.enableQueryOptimization) {
            logger->warn("Engine: исполнитель БД не задан, оптимизатор запросов отключён");
        }

        telemetry::TelemetrySources sources;
        sources.tier = tier;
        sources.assets = collaborators.assets;
        sources.images = collaborators.images;
        sources.pools = collaborators.pools;
        if (predictor) {
            std::weak_ptr<prediction::PredictiveLoader> weak = predictor;
            sources.prefetchAccuracy = [weak]() {
                auto p = weak.lock();
                return p ? p->getPredictionAccuracy() : 0.0;
            };
        }
        analytics->setSources(sources);

        orchestrator::OrchestratorComponents components;
        components.tier = tier;
        components.analytics = analytics;
        components.predictor = predictor;
        components.queries = queries;
        components.assets = collaborators.assets;
        components.images = collaborators.images;
        components.pools = collaborators.pools;
        orchestrator = std::make_shared<orchestrator::CacheOrchestrator>(config.orchestrator, components, clock, scheduler);
    }

    void start() {
        if (!analytics->loadStoredData()) {
            logger->debug("Engine: сохранённой аналитики нет");
        }
        if (config.enableMonitoring && !analytics->startMonitoring(config.telemetry.monitoringIntervalMs)) {
            throw std::runtime_error("analytics monitoring did not start");
        }
        if (predictor) {
            if (!predictor->loadStoredData()) {
                logger->debug("Engine: сохранённых паттернов нет");
            }
            if (!predictor->start()) {
                logger->warn("Engine: самонастройка предсказателя не запущена");
            }
        }
        if (queries) {
            if (!queries->loadStoredData()) {
                logger->debug("Engine: сохранённой статистики запросов нет");
            }
            if (!queries->start()) {
                logger->warn("Engine: периодическая оптимизация запросов не запущена");
            }
        }
        if (!orchestrator->start()) {
            throw std::runtime_error("orchestrator health check did not start");
        }
    }

    // Порядок обратный запуску: таймеры, сохранение, потоки
    void stopAll() {
        if (orchestrator) orchestrator->stop();
        if (queries) {
            queries->stop();
            queries->persistData();
        }
        if (predictor) {
            predictor->stop();
            predictor->persistData();
        }
        if (analytics) {
            analytics->stopMonitoring();
            analytics->persistData();
        }
        if (scheduler) {
            scheduler->cancelAll();
            scheduler->stop();
        }
        if (pool) pool->stop();
    }

    void reset() {
        orchestrator.reset();
        queries.reset();
        predictor.reset();
        analytics.reset();
        pool.reset();
        scheduler.reset();
    }
};

Engine::Engine(const EngineConfig& config, const EngineCollaborators& collaborators)
    : pImpl(std::make_unique<Impl>(config, collaborators)) {}

Engine::~Engine() {
    shutdown();
}

bool Engine::initialize() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized) {
        return true;
    }
    if (!pImpl->config.validate()) {
        pImpl->logger->error("Engine: некорректная конфигурация");
        return false;
    }
    try {
        common::setLogLevel(pImpl->config.logLevel);
        pImpl->build();
        pImpl->start();
    } catch (const std::exception& e) {
        pImpl->logger->error("Engine: ошибка инициализации: {}", e.what());
        pImpl->stopAll();
        pImpl->reset();
        return false;
    }
    pImpl->initialized = true;
    pImpl->logger->info("Engine: инициализирован (прогноз: {}, запросы: {})",
                        pImpl->predictor != nullptr, pImpl->queries != nullptr);
    return true;
}

void Engine::shutdown() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized) {
        return;
    }
    try {
        pImpl->stopAll();
    } catch (const std::exception& e) {
        pImpl->logger->error("Engine: ошибка при остановке: {}", e.what());
    }
    pImpl->initialized = false;
    pImpl->logger->info("Engine: остановлен");
}

bool Engine::isInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->initialized;
}

std::shared_ptr<orchestrator::CacheOrchestrator> Engine::orchestrator() const {
    return pImpl->orchestrator;
}

std::shared_ptr<telemetry::CacheAnalytics> Engine::analytics() const {
    return pImpl->analytics;
}

std::shared_ptr<prediction::PredictiveLoader> Engine::predictor() const {
    return pImpl->predictor;
}

std::shared_ptr<query::QueryOptimizer> Engine::queryOptimizer() const {
    return pImpl->queries;
}

std::shared_ptr<ICacheTier> Engine::tier() const {
    return pImpl->tier;
}

std::shared_ptr<IKeyValueStore> Engine::store() const {
    return pImpl->store;
}

std::shared_ptr<thread::Scheduler> Engine::scheduler() const {
    return pImpl->scheduler;
}

EngineConfig Engine::getConfiguration() const {
    return pImpl->config;
}

} // namespace engine
} // namespace core
} // namespace cachepilot

#include "core/orchestrator/CacheOrchestrator.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"
#include "core/query/QueryRules.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace cachepilot {
namespace core {
namespace orchestrator {

using telemetry::CacheEvent;
using telemetry::EventSource;
using telemetry::EventType;

namespace {

TierSetOptions tierOptions(const CacheStrategy& strategy) {
    TierSetOptions options;
    options.ttlMs = strategy.ttlMs;
    options.priority = strategy.priority;
    options.compression = strategy.compression;
    options.persist = strategy.persist;
    return options;
}

// Невалидный UTF-8 в строках заменяется, размер считается без исключений
size_t payloadSize(const nlohmann::json& data) {
    return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
}

bool probes(CacheLevel level, CacheLevel tier) {
    return level == CacheLevel::Auto || level == tier;
}

} // namespace

struct CacheOrchestrator::Impl {
    OrchestratorConfig config;
    OrchestratorComponents components;
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<thread::Scheduler> scheduler;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::optional<cache::CacheMetrics> baseline;
    size_t ticksSinceBaseline = 0;
    std::optional<thread::Scheduler::TaskId> healthTask;

    Impl(const OrchestratorConfig& cfg, const OrchestratorComponents& comps,
         std::shared_ptr<common::Clock> clk, std::shared_ptr<thread::Scheduler> sch)
        : config(cfg), components(comps), clock(std::move(clk)), scheduler(std::move(sch)),
          logger(common::getLogger("orchestrator")) {
        if (!clock) {
            clock = std::make_shared<common::SystemClock>();
        }
    }

    double elapsed(int64_t started) const {
        return static_cast<double>(std::max<int64_t>(clock->nowMs() - started, 0));
    }

    // Ошибки аналитики не должны ломать get/set
    void report(EventType type, const std::string& key, double duration, EventSource source,
                std::optional<size_t> size = std::nullopt, nlohmann::json metadata = nullptr) {
        if (!components.analytics) {
            return;
        }
        CacheEvent event;
        event.type = type;
        event.key = key;
        event.duration = duration;
        event.source = source;
        event.size = size;
        event.metadata = std::move(metadata);
        try {
            components.analytics->recordEvent(std::move(event));
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: событие {} не записано: {}", key, e.what());
        }
    }

    // Проверка значения из кэша. Устаревшее значение удаляется из тира
    bool accept(const GetOptions& options, const std::string& tierKey, const nlohmann::json& value) {
        if (!options.validate) {
            return true;
        }
        bool valid = false;
        try {
            valid = options.validate(value);
        } catch (const std::exception& e) {
            logger->warn("CacheOrchestrator: валидатор {} бросил исключение: {}", tierKey, e.what());
        } catch (...) {
            logger->warn("CacheOrchestrator: валидатор {} бросил неизвестное исключение", tierKey);
        }
        if (!valid) {
            logger->debug("CacheOrchestrator: {} не прошёл проверку, удаляется", tierKey);
            try {
                components.tier->remove(tierKey);
            } catch (const std::exception& e) {
                logger->error("CacheOrchestrator: не удалось удалить {}: {}", tierKey, e.what());
            }
        }
        return valid;
    }

    std::optional<nlohmann::json> probeMemory(const std::string& key, const GetOptions& options) {
        try {
            auto value = components.tier->get(key);
            if (value && accept(options, key, *value)) {
                return value;
            }
        } catch (const std::exception& e) {
            logger->warn("CacheOrchestrator: ошибка тира памяти для {}: {}", key, e.what());
            report(EventType::Error, key, 0.0, EventSource::Memory, std::nullopt, {{"tier", "memory"}, {"error", e.what()}});
        } catch (...) {
            logger->warn("CacheOrchestrator: ошибка тира памяти для {}: неизвестная ошибка", key);
            report(EventType::Error, key, 0.0, EventSource::Memory, std::nullopt, {{"tier", "memory"}, {"error", "unknown"}});
        }
        return std::nullopt;
    }

    std::optional<nlohmann::json> probePredictive(const std::string& key, const GetOptions& options) {
        try {
            if (!components.predictor->hasPredictionFor(key)) {
                return std::nullopt;
            }
            std::string tierKey = prediction::prefetchKey(key);
            auto value = components.tier->get(tierKey);
            if (value && accept(options, tierKey, *value)) {
                return value;
            }
        } catch (const std::exception& e) {
            logger->warn("CacheOrchestrator: ошибка предзагрузки для {}: {}", key, e.what());
            report(EventType::Error, key, 0.0, EventSource::Memory, std::nullopt, {{"tier", "predictive"}, {"error", e.what()}});
        } catch (...) {
            logger->warn("CacheOrchestrator: ошибка предзагрузки для {}: неизвестная ошибка", key);
            report(EventType::Error, key, 0.0, EventSource::Memory, std::nullopt, {{"tier", "predictive"}, {"error", "unknown"}});
        }
        return std::nullopt;
    }

    std::optional<nlohmann::json> probeAsset(const std::string& key, const GetOptions& options) {
        try {
            auto value = components.assets->fetch(key);
            if (value && components.tier && !options.cancel.isCancelled()) {
                if (!components.tier->set(key, *value, tierOptions(options.strategy))) {
                    logger->warn("CacheOrchestrator: ассет {} не записан в память", key);
                }
            }
            return value;
        } catch (const std::exception& e) {
            logger->warn("CacheOrchestrator: ошибка загрузки ассета {}: {}", key, e.what());
            report(EventType::Error, key, 0.0, EventSource::Cdn, std::nullopt, {{"tier", "cdn"}, {"error", e.what()}});
        } catch (...) {
            logger->warn("CacheOrchestrator: ошибка загрузки ассета {}: неизвестная ошибка", key);
            report(EventType::Error, key, 0.0, EventSource::Cdn, std::nullopt, {{"tier", "cdn"}, {"error", "unknown"}});
        }
        return std::nullopt;
    }

    std::optional<nlohmann::json> probeQuery(const std::string& key, const GetOptions& options) {
        try {
            query::QueryOptions queryOptions;
            queryOptions.cancel = options.cancel;
            return components.queries->executeQuery(queryText(key), nlohmann::json::array(), queryOptions);
        } catch (const std::exception& e) {
            logger->warn("CacheOrchestrator: ошибка запроса {}: {}", key, e.what());
            report(EventType::Error, key, 0.0, EventSource::Network, std::nullopt, {{"tier", "query"}, {"error", e.what()}});
        } catch (...) {
            logger->warn("CacheOrchestrator: ошибка запроса {}: неизвестная ошибка", key);
            report(EventType::Error, key, 0.0, EventSource::Network, std::nullopt, {{"tier", "query"}, {"error", "unknown"}});
        }
        return std::nullopt;
    }

    bool store(const std::string& key, const nlohmann::json& data, const SetOptions& options, double loadTimeMs) {
        bool stored = false;
        if (components.tier) {
            try {
                stored = components.tier->set(key, data, tierOptions(options.strategy));
            } catch (const std::exception& e) {
                logger->error("CacheOrchestrator: ошибка записи {}: {}", key, e.what());
            } catch (...) {
                logger->error("CacheOrchestrator: ошибка записи {}: неизвестная ошибка", key);
            }
        }
        if (components.assets && isAssetKey(key)) {
            try {
                components.assets->registerAsset(key, {{"size", payloadSize(data)}, {"registeredAt", clock->nowMs()}});
            } catch (const std::exception& e) {
                logger->warn("CacheOrchestrator: ассет {} не зарегистрирован: {}", key, e.what());
            } catch (...) {
                logger->warn("CacheOrchestrator: ассет {} не зарегистрирован: неизвестная ошибка", key);
            }
        }
        if (components.images && (isImageKey(key) || isImageValue(data))) {
            try {
                components.images->analyzeImage(key, data);
            } catch (const std::exception& e) {
                logger->warn("CacheOrchestrator: анализ изображения {} не удался: {}", key, e.what());
            } catch (...) {
                logger->warn("CacheOrchestrator: анализ изображения {} не удался: неизвестная ошибка", key);
            }
        }
        if (components.predictor && !options.skipPrediction && options.strategy.enablePrediction) {
            try {
                components.predictor->recordUserAction(key, data, loadTimeMs);
            } catch (const std::exception& e) {
                logger->warn("CacheOrchestrator: действие {} не учтено: {}", key, e.what());
            } catch (...) {
                logger->warn("CacheOrchestrator: действие {} не учтено: неизвестная ошибка", key);
            }
        }
        return stored;
    }

    // Снимок метрик: через аналитику, иначе по статистике тира
    cache::CacheMetrics snapshot() {
        if (components.analytics) {
            return components.analytics->collectMetrics();
        }
        cache::CacheMetrics m;
        if (components.tier) {
            TierStatistics stats = components.tier->getStatistics();
            m.totalRequests = stats.totalRequests;
            m.cacheHits = stats.hitCount;
            m.cacheMisses = stats.missCount;
            m.memoryUsage = stats.memoryUsage;
            m.memoryUtilization = stats.usagePercentage;
            m.diskUsage = stats.diskUsage;
            m.compressionRatio = stats.compressionRatio;
            m.evictionRate = static_cast<double>(stats.evictionCount) /
                             static_cast<double>(std::max<uint64_t>(stats.totalRequests, 1));
            m.recompute();
        }
        m.lastUpdate = clock->nowMs();
        return m;
    }

    void compactPools(OptimizationResult& result) {
        if (!components.pools) {
            return;
        }
        try {
            for (const auto& pool : components.pools->getPools()) {
                if (pool.fragmentation > config.fragmentationThreshold && components.pools->compactPool(pool.name)) {
                    result.actions.push_back(fmt::format("Compacted memory pool {} (fragmentation {:.0f}%)",
                                                         pool.name, pool.fragmentation * 100.0));
                }
            }
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: ошибка дефрагментации пулов: {}", e.what());
        }
    }

    void tuneTier(const cache::CacheMetrics& metrics, OptimizationResult& result) {
        if (!components.tier) {
            return;
        }
        try {
            size_t capacity = components.tier->capacity();
            bool missing = metrics.totalRequests > 0 && metrics.hitRatio < config.hitRatioThreshold;
            if (metrics.memoryUtilization > config.memoryPressureThreshold) {
                size_t narrowed = static_cast<size_t>(static_cast<double>(capacity) * config.capacityShrinkFactor);
                components.tier->setCapacity(narrowed);
                components.tier->setCompressionEnabled(true);
                result.actions.push_back(fmt::format("Reduced cache capacity {} -> {} bytes and enabled compression",
                                                     capacity, narrowed));
            } else if (metrics.evictionRate > config.evictionRateThreshold || missing) {
                size_t widened = static_cast<size_t>(static_cast<double>(capacity) * config.capacityGrowFactor);
                components.tier->setCapacity(widened);
                result.actions.push_back(fmt::format("Increased cache capacity {} -> {} bytes", capacity, widened));
            }
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: ошибка настройки тира: {}", e.what());
        }
    }

    void reviewQueries(OptimizationResult& result) {
        if (!components.queries) {
            return;
        }
        try {
            auto analytics = components.queries->getQueryAnalytics();
            if (analytics.slowQueries > 0) {
                result.actions.push_back(fmt::format("Detected {} slow database queries", analytics.slowQueries));
                result.recommendations.push_back(fmt::format(
                    "Review {} slow queries and apply the suggested indexes", analytics.slowQueries));
            }
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: ошибка анализа запросов: {}", e.what());
        }
    }

    void tuneImages(OptimizationResult& result) {
        if (!components.images) {
            return;
        }
        try {
            ImageStats stats = components.images->getStats();
            if (stats.totalImages > 0 && stats.compressionRatio > config.weakCompressionRatio) {
                components.images->setCompressionQuality(config.reducedImageQuality);
                result.actions.push_back(fmt::format("Lowered image quality to {:.2f} (compression ratio {:.2f})",
                                                     config.reducedImageQuality, stats.compressionRatio));
            }
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: ошибка настройки изображений: {}", e.what());
        }
    }

    void collectGarbage(OptimizationResult& result) {
        size_t freed = 0;
        size_t expired = 0;
        try {
            if (components.pools) freed = components.pools->collectGarbage();
            if (components.tier) expired = components.tier->collectGarbage();
        } catch (const std::exception& e) {
            logger->error("CacheOrchestrator: ошибка сборки мусора: {}", e.what());
        }
        if (components.pools || components.tier) {
            result.actions.push_back(fmt::format("Garbage collection freed {} bytes and removed {} expired entries",
                                                 freed, expired));
        }
    }
};

CacheOrchestrator::CacheOrchestrator(const OrchestratorConfig& config,
                                     const OrchestratorComponents& components,
                                     std::shared_ptr<common::Clock> clock,
                                     std::shared_ptr<thread::Scheduler> scheduler)
    : pImpl(std::make_unique<Impl>(config, components, std::move(clock), std::move(scheduler))) {}

CacheOrchestrator::~CacheOrchestrator() {
    stop();
}

bool CacheOrchestrator::start() {
    if (!pImpl->scheduler) {
        pImpl->logger->warn("CacheOrchestrator: проверка здоровья без планировщика невозможна");
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->healthTask) {
        return true;
    }
    pImpl->healthTask = pImpl->scheduler->scheduleEvery(pImpl->config.healthCheckIntervalMs,
                                                        [this]() { runHealthCheck(); }, "orchestrator_health");
    pImpl->logger->info("CacheOrchestrator: проверка здоровья каждые {} мс", pImpl->config.healthCheckIntervalMs);
    return true;
}

void CacheOrchestrator::stop() {
    std::optional<thread::Scheduler::TaskId> task;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        task = pImpl->healthTask;
        pImpl->healthTask.reset();
    }
    if (task && pImpl->scheduler) {
        pImpl->scheduler->cancel(*task);
    }
}

GetResult CacheOrchestrator::get(const std::string& key, const GetOptions& options) {
    int64_t started = pImpl->clock->nowMs();
    const auto& c = pImpl->components;
    CacheLevel level = options.strategy.level;
    GetResult result;

    auto hit = [&](nlohmann::json value, DataSource source, EventSource eventSource) {
        result.durationMs = pImpl->elapsed(started);
        pImpl->report(EventType::Hit, key, result.durationMs, eventSource, payloadSize(value), {{"tier", toString(source)}});
        result.data = std::move(value);
        result.fromCache = true;
        result.source = source;
        return result;
    };
    auto cancelled = [&]() {
        if (!options.cancel.isCancelled()) {
            return false;
        }
        pImpl->logger->debug("CacheOrchestrator: get {} отменён", key);
        return true;
    };

    if (!cancelled() && c.tier && probes(level, CacheLevel::Memory)) {
        if (auto value = pImpl->probeMemory(key, options)) {
            return hit(std::move(*value), DataSource::Memory, EventSource::Memory);
        }
    }
    if (!cancelled() && c.tier && c.predictor && probes(level, CacheLevel::Predictive)) {
        if (auto value = pImpl->probePredictive(key, options)) {
            return hit(std::move(*value), DataSource::Predictive, EventSource::Memory);
        }
    }
    if (!cancelled() && c.assets && probes(level, CacheLevel::Cdn) && isAssetKey(key)) {
        if (auto value = pImpl->probeAsset(key, options)) {
            return hit(std::move(*value), DataSource::Cdn, EventSource::Cdn);
        }
    }
    if (!cancelled() && c.queries && probes(level, CacheLevel::Query) && isQueryKey(key)) {
        if (auto value = pImpl->probeQuery(key, options)) {
            return hit(std::move(*value), DataSource::Query, EventSource::Network);
        }
    }

    if (!options.fallback || cancelled()) {
        result.durationMs = pImpl->elapsed(started);
        pImpl->report(EventType::Miss, key, result.durationMs, EventSource::Memory);
        return result;
    }

    try {
        int64_t loadStarted = pImpl->clock->nowMs();
        nlohmann::json data = options.fallback();
        double loadTime = pImpl->elapsed(loadStarted);
        if (!options.cancel.isCancelled()) {
            SetOptions setOptions;
            setOptions.strategy = options.strategy;
            pImpl->store(key, data, setOptions, loadTime);
        }
        result.durationMs = pImpl->elapsed(started);
        pImpl->report(EventType::Miss, key, result.durationMs, EventSource::Network, payloadSize(data), {{"tier", "fallback"}});
        result.data = std::move(data);
        result.source = DataSource::Fallback;
    } catch (const std::exception& e) {
        result.durationMs = pImpl->elapsed(started);
        pImpl->logger->error("CacheOrchestrator: fallback для {} завершился ошибкой: {}", key, e.what());
        pImpl->report(EventType::Error, key, result.durationMs, EventSource::Network, std::nullopt,
                      {{"tier", "fallback"}, {"error", e.what()}});
    } catch (...) {
        result.durationMs = pImpl->elapsed(started);
        pImpl->logger->error("CacheOrchestrator: fallback для {} завершился неизвестной ошибкой", key);
        pImpl->report(EventType::Error, key, result.durationMs, EventSource::Network, std::nullopt,
                      {{"tier", "fallback"}, {"error", "unknown"}});
    }
    return result;
}

bool CacheOrchestrator::set(const std::string& key, const nlohmann::json& data, const SetOptions& options) {
    int64_t started = pImpl->clock->nowMs();
    bool stored = pImpl->store(key, data, options, 0.0);
    if (!stored) {
        pImpl->logger->warn("CacheOrchestrator: {} не записан в тир", key);
    }
    pImpl->logger->trace("CacheOrchestrator: set {} за {} мс", key, pImpl->elapsed(started));
    return stored;
}

bool CacheOrchestrator::remove(const std::string& key) {
    if (!pImpl->components.tier) {
        return false;
    }
    try {
        return pImpl->components.tier->remove(key);
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheOrchestrator: ошибка удаления {}: {}", key, e.what());
        return false;
    }
}

std::vector<prediction::PredictionResult> CacheOrchestrator::prefetchForRoute(const std::string& route) {
    auto& predictor = pImpl->components.predictor;
    if (!predictor) {
        return {};
    }
    try {
        prediction::ContextUpdate update;
        update.route = route;
        predictor->updateContext(update);
        auto predictions = predictor->generatePredictions(route);
        predictor->executePredictiveLoading(predictions);
        pImpl->logger->debug("CacheOrchestrator: для {} запущено {} предсказаний", route, predictions.size());
        return predictions;
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheOrchestrator: предзагрузка для {} не удалась: {}", route, e.what());
        return {};
    }
}

void CacheOrchestrator::trackNavigation(const std::string& from, const std::string& to, double loadTimeMs) {
    auto& predictor = pImpl->components.predictor;
    if (!predictor) {
        return;
    }
    try {
        // Переход учится в контексте исходного экрана
        prediction::ContextUpdate origin;
        origin.route = from;
        predictor->updateContext(origin);
        predictor->recordUserAction(to, {{"from", from}, {"to", to}}, loadTimeMs);
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheOrchestrator: переход {} -> {} не учтён: {}", from, to, e.what());
        return;
    }
    prefetchForRoute(to);
}

OptimizationResult CacheOrchestrator::optimizePerformance() {
    OptimizationResult result;
    result.before = pImpl->snapshot();
    pImpl->logger->info("CacheOrchestrator: оптимизация, hitRatio {:.2f}, память {:.2f}",
                        result.before.hitRatio, result.before.memoryUtilization);

    pImpl->compactPools(result);
    pImpl->tuneTier(result.before, result);
    pImpl->reviewQueries(result);
    pImpl->tuneImages(result);
    pImpl->collectGarbage(result);

    result.after = pImpl->snapshot();
    result.improvements["hitRatio"] = result.after.hitRatio - result.before.hitRatio;
    result.improvements["memoryUtilization"] = result.after.memoryUtilization - result.before.memoryUtilization;
    result.improvements["memoryUsage"] = static_cast<double>(result.after.memoryUsage) -
                                         static_cast<double>(result.before.memoryUsage);
    result.improvements["responseTime"] = result.after.totalResponseTime - result.before.totalResponseTime;

    for (const auto& rec : telemetry::CacheAnalytics::generateOptimizationRecommendations(result.after)) {
        result.recommendations.push_back(rec.description);
    }
    pImpl->logger->info("CacheOrchestrator: оптимизация завершена, действий: {}", result.actions.size());
    return result;
}

HealthCheckResult CacheOrchestrator::runHealthCheck() {
    HealthCheckResult result;
    cache::CacheMetrics current;
    try {
        current = pImpl->snapshot();
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheOrchestrator: снимок метрик не получен: {}", e.what());
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->baseline) {
            pImpl->baseline = current;
            pImpl->ticksSinceBaseline = 0;
            result.baselineRefreshed = true;
            return result;
        }
        const auto& base = *pImpl->baseline;
        double hitRatioDrop = std::max(0.0, base.hitRatio - current.hitRatio);
        double loadTimeIncrease = std::max(0.0, current.totalResponseTime - base.totalResponseTime);
        double memoryGrowth = 0.0;
        if (base.memoryUsage > 0) {
            memoryGrowth = std::max(0.0, (static_cast<double>(current.memoryUsage) - static_cast<double>(base.memoryUsage)) /
                                         static_cast<double>(base.memoryUsage));
        }
        result.degradation = (hitRatioDrop + loadTimeIncrease / 10000.0 + memoryGrowth) / 3.0;

        if (++pImpl->ticksSinceBaseline >= pImpl->config.baselineRefreshTicks) {
            pImpl->baseline = current;
            pImpl->ticksSinceBaseline = 0;
            result.baselineRefreshed = true;
        }
    }

    if (result.degradation > pImpl->config.degradationThreshold) {
        pImpl->logger->warn("CacheOrchestrator: деградация {:.3f}, запуск оптимизации", result.degradation);
        optimizePerformance();
        result.optimized = true;
    }
    return result;
}

PerformanceReport CacheOrchestrator::getPerformanceReport() const {
    const auto& c = pImpl->components;
    PerformanceReport report;
    report.generatedAt = pImpl->clock->nowMs();
    if (c.analytics) {
        report.metrics = c.analytics->getCurrentMetrics();
        report.alerts = c.analytics->getActiveAlerts();
    }

    report.scores.cache = report.metrics.hitRatio * 100.0;
    report.scores.memory = (1.0 - std::clamp(report.metrics.memoryUtilization, 0.0, 1.0)) * 100.0;
    report.scores.images = 100.0;
    try {
        if (c.tier && !c.analytics) {
            TierStatistics stats = c.tier->getStatistics();
            report.metrics.hitRatio = stats.hitRate;
            report.metrics.memoryUtilization = stats.usagePercentage;
            report.scores.cache = stats.hitRate * 100.0;
            report.scores.memory = (1.0 - std::clamp(stats.usagePercentage, 0.0, 1.0)) * 100.0;
        }
        if (c.queries) {
            report.scores.database = c.queries->getQueryAnalytics().optimizationScore * 10.0;
        }
        if (c.images) {
            ImageStats stats = c.images->getStats();
            if (stats.totalImages > 0) {
                report.scores.images = (1.0 - std::clamp(stats.compressionRatio, 0.0, 1.0)) * 100.0;
            }
        }
        double accuracy = c.predictor ? c.predictor->getPredictionAccuracy() : report.metrics.prefetchAccuracy;
        report.scores.predictions = std::clamp(accuracy, 0.0, 1.0) * 100.0;
    } catch (const std::exception& e) {
        pImpl->logger->error("CacheOrchestrator: ошибка сбора отчёта: {}", e.what());
    }

    double overall = report.scores.cache * 0.3 + report.scores.memory * 0.2 + report.scores.database * 0.2 +
                     report.scores.images * 0.15 + report.scores.predictions * 0.15;
    report.overallScore = static_cast<int>(std::lround(overall));
    report.grade = gradeForScore(report.overallScore);
    report.status = statusForScore(report.overallScore);

    for (const auto& rec : telemetry::CacheAnalytics::generateOptimizationRecommendations(report.metrics)) {
        report.recommendations.push_back(rec.description);
    }
    return report;
}

nlohmann::json CacheOrchestrator::executeQuery(const std::string& sql, const nlohmann::json& params,
                                               const query::QueryOptions& options) {
    if (!pImpl->components.queries) {
        throw QueryExecutionError(query::makeQueryId(sql, params), "query optimizer is not configured");
    }
    return pImpl->components.queries->executeQuery(sql, params, options);
}

std::future<nlohmann::json> CacheOrchestrator::batchQuery(const std::string& sql, const nlohmann::json& params) {
    if (!pImpl->components.queries) {
        std::promise<nlohmann::json> failed;
        failed.set_exception(std::make_exception_ptr(
            QueryExecutionError(query::makeQueryId(sql, params), "query optimizer is not configured")));
        return failed.get_future();
    }
    return pImpl->components.queries->batchQuery(sql, params);
}

query::QueryAnalysis CacheOrchestrator::analyzeQuery(const std::string& sql) const {
    if (pImpl->components.queries) {
        return pImpl->components.queries->analyzeQuery(sql);
    }
    return query::analyzeQuery(sql);
}

void CacheOrchestrator::recordUserAction(const std::string& action, const nlohmann::json& data, double loadTimeMs) {
    if (pImpl->components.predictor) {
        pImpl->components.predictor->recordUserAction(action, data, loadTimeMs);
    }
}

std::vector<prediction::PredictionResult> CacheOrchestrator::generatePredictions(const std::string& route) {
    if (!pImpl->components.predictor) {
        return {};
    }
    return pImpl->components.predictor->generatePredictions(route);
}

cache::CacheMetrics CacheOrchestrator::getCurrentMetrics() const {
    if (!pImpl->components.analytics) {
        return cache::CacheMetrics{};
    }
    return pImpl->components.analytics->getCurrentMetrics();
}

std::vector<telemetry::PerformanceAlert> CacheOrchestrator::getActiveAlerts() const {
    if (!pImpl->components.analytics) {
        return {};
    }
    return pImpl->components.analytics->getActiveAlerts();
}

bool CacheOrchestrator::acknowledgeAlert(const std::string& alertId) {
    return pImpl->components.analytics && pImpl->components.analytics->acknowledgeAlert(alertId);
}

OrchestratorConfig CacheOrchestrator::getConfiguration() const {
    return pImpl->config;
}

} // namespace orchestrator
} // namespace core
} // namespace cachepilot

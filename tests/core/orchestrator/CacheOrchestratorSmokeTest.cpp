#include <algorithm>
#include <atomic>
#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include "core/cache/tier/MemoryCacheTier.hpp"
#include "core/common/Cancellation.hpp"
#include "core/common/Clock.hpp"
#include "core/common/Errors.hpp"
#include "core/orchestrator/CacheOrchestrator.hpp"
#include "core/query/QueryRules.hpp"

using namespace cachepilot::core;
using namespace cachepilot::core::orchestrator;
using cachepilot::core::common::ManualClock;

namespace {

// Тир, который ломается на любой операции
class BrokenTier : public ICacheTier {
public:
    std::optional<nlohmann::json> get(const std::string&, const TierGetOptions&) override {
        throw std::runtime_error("tier offline");
    }
    bool set(const std::string&, const nlohmann::json&, const TierSetOptions&) override {
        throw std::runtime_error("tier offline");
    }
    bool remove(const std::string&) override { throw std::runtime_error("tier offline"); }
    void clear() override {}
    size_t collectGarbage() override { return 0; }
    size_t capacity() const override { return 0; }
    void setCapacity(size_t) override {}
    void setCompressionEnabled(bool) override {}
    TierStatistics getStatistics() const override { return {}; }
};

class FakeAssets : public IAssetFetcher {
public:
    std::atomic<int> fetches{0};
    std::atomic<int> registrations{0};

    std::optional<nlohmann::json> fetch(const std::string& key) override {
        ++fetches;
        return nlohmann::json{{"url", key}, {"bytes", 512}};
    }
    void registerAsset(const std::string&, const nlohmann::json&) override { ++registrations; }
    AssetMetrics getMetrics() const override { return {}; }
};

class FakeImages : public IImagePipeline {
public:
    void analyzeImage(const std::string&, const nlohmann::json&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.totalImages;
    }
    void setCompressionQuality(double quality) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.quality = quality;
    }
    ImageStats getStats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }
    void seed(size_t images, double ratio) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.totalImages = images;
        stats_.compressionRatio = ratio;
    }
private:
    mutable std::mutex mutex_;
    ImageStats stats_;
};

class FakePools : public IMemoryPoolManager {
public:
    std::vector<MemoryPoolInfo> getPools() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pools_;
    }
    bool compactPool(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pool : pools_) {
            if (pool.name == name) {
                pool.fragmentation = 0.0;
                return true;
            }
        }
        return false;
    }
    size_t collectGarbage() override { return 128; }
private:
    mutable std::mutex mutex_;
    std::vector<MemoryPoolInfo> pools_ = {
        {"small_objects", 4096, 1024, 0.42},
        {"images", 8192, 2048, 0.1}
    };
};

class FakeDatabase : public IDatabaseExecutor {
public:
    std::atomic<int> calls{0};
    nlohmann::json execute(const std::string&, const nlohmann::json&) override {
        ++calls;
        return nlohmann::json::array({{{"id", 1}, {"name", "Rex"}}});
    }
};

// Картинка как есть: байты JPEG, не UTF-8
class BinaryAssets : public IAssetFetcher {
public:
    std::optional<nlohmann::json> fetch(const std::string&) override {
        return nlohmann::json{{"bytes", std::string("\xff\xd8\xff\xe0")}};
    }
    void registerAsset(const std::string&, const nlohmann::json&) override {}
    AssetMetrics getMetrics() const override { return {}; }
};

class HookedDatabase : public IDatabaseExecutor {
public:
    std::atomic<int> calls{0};
    std::function<void()> onExecute;
    nlohmann::json execute(const std::string&, const nlohmann::json&) override {
        ++calls;
        if (onExecute) {
            onExecute();
        }
        return nlohmann::json::array({{{"id", 1}}});
    }
};

std::shared_ptr<cache::MemoryCacheTier> makeTier(std::shared_ptr<ManualClock> clock, size_t budget = 1024 * 1024) {
    cache::CacheConfig config;
    config.maxMemorySize = budget;
    config.enablePersistence = false;
    return std::make_shared<cache::MemoryCacheTier>(config, clock);
}

bool hasAction(const OptimizationResult& result, const std::string& prefix) {
    return std::any_of(result.actions.begin(), result.actions.end(),
                       [&prefix](const std::string& a) { return a.rfind(prefix, 0) == 0; });
}

} // namespace

void smokeTestCacheOrchestrator() {
    std::cout << "Testing CacheOrchestrator get/set...\n";

    auto clock = std::make_shared<ManualClock>();
    OrchestratorComponents components;
    components.tier = makeTier(clock);
    components.analytics = std::make_shared<telemetry::CacheAnalytics>(telemetry::TelemetryConfig{}, clock);
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    int loads = 0;
    GetOptions options;
    options.strategy.ttlMs = 1000;
    options.fallback = [&loads]() {
        ++loads;
        return nlohmann::json{{"name", "Rex"}};
    };

    auto first = orchestrator.get("k1", options);
    assert(first.data && (*first.data)["name"] == "Rex");
    assert(!first.fromCache);
    assert(first.source == DataSource::Fallback);
    assert(loads == 1);

    auto second = orchestrator.get("k1", options);
    assert(second.fromCache);
    assert(second.source == DataSource::Memory);
    assert(loads == 1);

    clock->advance(1000);
    auto third = orchestrator.get("k1", options);
    assert(third.source == DataSource::Fallback);
    assert(loads == 2);

    // Без fallback промах возвращает пустой результат
    auto missing = orchestrator.get("nothing_here");
    assert(!missing.data);
    assert(!missing.fromCache);
    assert(missing.source == DataSource::None);

    auto metrics = orchestrator.getCurrentMetrics();
    assert(metrics.totalRequests == 4);
    assert(metrics.cacheHits == 1);
    assert(metrics.cacheMisses == 3);

    assert(orchestrator.set("k2", {{"id", 2}}));
    GetOptions memoryOnly;
    memoryOnly.strategy.level = CacheLevel::Memory;
    auto stored = orchestrator.get("k2", memoryOnly);
    assert(stored.data && (*stored.data)["id"] == 2);
    assert(orchestrator.remove("k2"));
    assert(!orchestrator.get("k2", memoryOnly).data);

    std::cout << "[OK] CacheOrchestrator smoke test\n";
}

void testCacheOrchestratorValidationAndCancel() {
    std::cout << "Testing CacheOrchestrator validation, cancellation and tier errors...\n";

    auto clock = std::make_shared<ManualClock>();
    OrchestratorComponents components;
    components.tier = makeTier(clock);
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    assert(orchestrator.set("profile", {{"version", 1}}));
    GetOptions options;
    options.validate = [](const nlohmann::json& v) { return v.value("version", 0) == 2; };
    options.fallback = []() { return nlohmann::json{{"version", 2}}; };

    // Устаревшая версия отбрасывается и перезагружается
    auto refreshed = orchestrator.get("profile", options);
    assert(refreshed.source == DataSource::Fallback);
    assert((*refreshed.data)["version"] == 2);
    auto valid = orchestrator.get("profile", options);
    assert(valid.source == DataSource::Memory);

    // Отменённый запрос не вызывает fallback
    common::CancellationSource source;
    source.cancel();
    bool called = false;
    GetOptions cancelled;
    cancelled.cancel = source.token();
    cancelled.fallback = [&called]() {
        called = true;
        return nlohmann::json(1);
    };
    auto none = orchestrator.get("never_cached", cancelled);
    assert(!none.data);
    assert(!called);

    // Сломанный тир: get/set не бросают, данные приходят из fallback
    auto brokenClock = std::make_shared<ManualClock>();
    OrchestratorComponents broken;
    broken.tier = std::make_shared<BrokenTier>();
    broken.analytics = std::make_shared<telemetry::CacheAnalytics>(telemetry::TelemetryConfig{}, brokenClock);
    CacheOrchestrator degraded(OrchestratorConfig{}, broken, brokenClock);
    GetOptions withFallback;
    withFallback.fallback = []() { return nlohmann::json{{"ok", true}}; };
    auto result = degraded.get("k", withFallback);
    assert(result.data && (*result.data)["ok"] == true);
    assert(result.source == DataSource::Fallback);
    assert(!degraded.set("k", 1));
    assert(!degraded.remove("k"));
    assert(degraded.getCurrentMetrics().errorCount == 1);

    // Ошибка fallback тоже поглощается
    GetOptions failing;
    failing.fallback = []() -> nlohmann::json { throw std::runtime_error("backend down"); };
    auto failed = orchestrator.get("fails", failing);
    assert(!failed.data);
    assert(failed.source == DataSource::None);

    std::cout << "[OK] CacheOrchestrator validation test\n";
}

void testCacheOrchestratorUnusualData() {
    std::cout << "Testing CacheOrchestrator with binary payloads, cancellation and odd errors...\n";

    auto clock = std::make_shared<ManualClock>();
    auto tier = makeTier(clock);
    auto database = std::make_shared<HookedDatabase>();
    OrchestratorComponents components;
    components.tier = tier;
    components.assets = std::make_shared<BinaryAssets>();
    components.analytics = std::make_shared<telemetry::CacheAnalytics>(telemetry::TelemetryConfig{}, clock);
    components.queries = std::make_shared<query::QueryOptimizer>(query::QueryOptimizerConfig{}, clock, database, tier);
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    // Байты не UTF-8 отдаются вызывающему как есть
    auto logo = orchestrator.get("asset:logo.jpg");
    assert(logo.source == DataSource::Cdn);
    assert(logo.data && (*logo.data)["bytes"].get<std::string>().size() == 4);

    GetOptions binary;
    binary.fallback = []() { return nlohmann::json{{"raw", std::string("\xff\xfe")}}; };
    auto raw = orchestrator.get("blob:1", binary);
    assert(raw.source == DataSource::Fallback);
    assert(raw.data && (*raw.data)["raw"].get<std::string>().size() == 2);

    // Отмена во время запроса: результат возвращается, но не кэшируется
    const std::string sql = "SELECT name FROM pets WHERE id = 1";
    const std::string cacheKey = query::queryCacheKey(query::makeQueryId(sql, nlohmann::json::array()));
    common::CancellationSource source;
    database->onExecute = [&source]() { source.cancel(); };
    GetOptions cancellable;
    cancellable.cancel = source.token();
    auto during = orchestrator.get("query:" + sql, cancellable);
    assert(during.source == DataSource::Query);
    assert(database->calls == 1);
    assert(!tier->get(cacheKey));

    database->onExecute = nullptr;
    assert(orchestrator.get("query:" + sql).source == DataSource::Query);
    assert(orchestrator.get("query:" + sql).source == DataSource::Query);
    assert(database->calls == 2);
    assert(tier->get(cacheKey));

    // Уже отменённый get не отдаёт даже значение из памяти
    assert(orchestrator.set("pet:7", {{"name", "Bim"}}));
    auto skipped = orchestrator.get("pet:7", cancellable);
    assert(!skipped.data);
    assert(skipped.source == DataSource::None);

    // fallback, бросающий не std::exception
    assert(orchestrator.getCurrentMetrics().errorCount == 0);
    GetOptions odd;
    odd.fallback = []() -> nlohmann::json { throw 7; };
    auto swallowed = orchestrator.get("odd", odd);
    assert(!swallowed.data);
    assert(orchestrator.getCurrentMetrics().errorCount == 1);

    std::cout << "[OK] CacheOrchestrator unusual data test\n";
}

void testCacheOrchestratorTiers() {
    std::cout << "Testing CacheOrchestrator CDN, query and predictive tiers...\n";

    auto clock = std::make_shared<ManualClock>();
    auto tier = makeTier(clock);
    auto assets = std::make_shared<FakeAssets>();
    auto images = std::make_shared<FakeImages>();
    auto database = std::make_shared<FakeDatabase>();

    OrchestratorComponents components;
    components.tier = tier;
    components.assets = assets;
    components.images = images;
    components.queries = std::make_shared<query::QueryOptimizer>(query::QueryOptimizerConfig{}, clock, database, tier);
    components.predictor = std::make_shared<prediction::PredictiveLoader>(
        prediction::PredictorConfig{}, clock, tier,
        [](const std::string& dataType) { return nlohmann::json{{"dataType", dataType}}; });
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    // CDN: первый раз из загрузчика, потом из памяти
    const std::string logo = "https://cdn.example.com/img/logo.png";
    auto cdn = orchestrator.get(logo);
    assert(cdn.source == DataSource::Cdn);
    assert(cdn.fromCache);
    assert(orchestrator.get(logo).source == DataSource::Memory);
    assert(assets->fetches == 1);

    // Изображение регистрируется как ассет и уходит в конвейер
    SetOptions quiet;
    quiet.skipPrediction = true;
    assert(orchestrator.set("photos/rex.jpg", {{"mimeType", "image/jpeg"}, {"bytes", 1000}}, quiet));
    assert(assets->registrations == 1);
    assert(images->getStats().totalImages == 1);
    assert(orchestrator.set("avatar", {{"contentType", "image/png"}}, quiet));
    assert(images->getStats().totalImages == 2);
    assert(assets->registrations == 1);

    // Запрос выполняется через оптимизатор запросов
    auto rows = orchestrator.get("query:SELECT name FROM pets WHERE id = 1");
    assert(rows.source == DataSource::Query);
    assert(rows.data && rows.data->size() == 1);
    assert(database->calls == 1);
    GetOptions queryOnly;
    queryOnly.strategy.level = CacheLevel::Query;
    assert(orchestrator.get("SELECT name FROM pets WHERE id = 1", queryOnly).source == DataSource::Query);
    assert(database->calls == 1); // результат из кэша запросов

    // Переход обучает предсказатель и предзагружает данные экрана
    orchestrator.trackNavigation("home", "view_pet_profile", 320.0);
    auto patterns = components.predictor->getPatterns();
    assert(patterns.size() == 1);
    assert(patterns[0].context.route == "home");
    assert(tier->get(prediction::prefetchKey("pet_profile_data")));
    auto predicted = orchestrator.get("pet_profile_data");
    assert(predicted.source == DataSource::Predictive);
    assert((*predicted.data)["dataType"] == "pet_profile_data");

    auto predictions = orchestrator.prefetchForRoute("home");
    assert(predictions.size() == 1);
    assert(predictions[0].dataType == "pet_profile_data");
    assert(orchestrator.generatePredictions("home").size() == 1);

    // set без skipPrediction учит паттерн, со skipPrediction нет
    assert(orchestrator.set("view_photos", 1, quiet));
    assert(components.predictor->getPatterns().size() == 1);
    assert(orchestrator.set("view_photos", 1));
    assert(components.predictor->getPatterns().size() == 2);

    std::cout << "[OK] CacheOrchestrator tiers test\n";
}

void testCacheOrchestratorOptimization() {
    std::cout << "Testing CacheOrchestrator optimizePerformance...\n";

    auto clock = std::make_shared<ManualClock>();
    auto tier = makeTier(clock, 10000);
    auto images = std::make_shared<FakeImages>();
    images->seed(3, 0.9);
    auto pools = std::make_shared<FakePools>();

    OrchestratorComponents components;
    components.tier = tier;
    components.images = images;
    components.pools = pools;
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    // Только промахи: hitRatio 0, ёмкость растёт
    orchestrator.get("a");
    orchestrator.get("b");
    auto result = orchestrator.optimizePerformance();
    assert(result.before.totalRequests == 2);
    assert(result.before.hitRatio == 0.0);
    assert(result.actions.size() == 4);
    assert(hasAction(result, "Compacted memory pool small_objects"));
    assert(hasAction(result, "Increased cache capacity 10000 -> 12500 bytes"));
    assert(hasAction(result, "Lowered image quality to 0.70"));
    assert(hasAction(result, "Garbage collection freed 128 bytes"));
    assert(tier->capacity() == 12500);
    assert(images->getStats().quality == 0.7);
    for (const auto& pool : pools->getPools()) {
        assert(pool.fragmentation <= 0.1);
    }
    assert(result.improvements.count("hitRatio") == 1);
    assert(result.toJson()["actions"].size() == 4);

    // Давление памяти: ёмкость сужается, сжатие включается
    auto pressureClock = std::make_shared<ManualClock>();
    auto small = makeTier(pressureClock, 1000);
    OrchestratorComponents pressured;
    pressured.tier = small;
    CacheOrchestrator squeezed(OrchestratorConfig{}, pressured, pressureClock);
    assert(squeezed.set("blob", nlohmann::json(std::string(878, 'x'))));
    assert(small->getStatistics().usagePercentage > 0.85);
    auto shrink = squeezed.optimizePerformance();
    assert(hasAction(shrink, "Reduced cache capacity 1000 -> 800 bytes and enabled compression"));
    assert(small->capacity() == 800);
    assert(small->getStatistics().memoryUsage <= 720);

    std::cout << "[OK] CacheOrchestrator optimization test\n";
}

void testCacheOrchestratorHealthCheck() {
    std::cout << "Testing CacheOrchestrator health check...\n";

    auto clock = std::make_shared<ManualClock>();
    auto tier = makeTier(clock);
    OrchestratorConfig config;
    config.baselineRefreshTicks = 2;
    OrchestratorComponents components;
    components.tier = tier;
    CacheOrchestrator orchestrator(config, components, clock);

    assert(!orchestrator.start()); // без планировщика

    assert(orchestrator.set("k", 1));
    orchestrator.get("k");
    orchestrator.get("k");

    auto first = orchestrator.runHealthCheck();
    assert(first.baselineRefreshed);
    assert(first.degradation == 0.0);
    assert(!first.optimized);

    // hitRatio 1.0 -> 0.25
    for (int i = 0; i < 6; ++i) {
        orchestrator.get("missing_" + std::to_string(i));
    }
    auto second = orchestrator.runHealthCheck();
    assert(std::abs(second.degradation - 0.25) < 1e-9);
    assert(second.optimized);
    assert(!second.baselineRefreshed);
    assert(tier->capacity() > 1024 * 1024);

    auto third = orchestrator.runHealthCheck();
    assert(third.optimized);
    assert(third.baselineRefreshed);

    auto fourth = orchestrator.runHealthCheck();
    assert(fourth.degradation == 0.0);
    assert(!fourth.optimized);

    // С планировщиком проверка запускается по таймеру
    auto scheduler = std::make_shared<thread::Scheduler>();
    scheduler->start();
    {
        CacheOrchestrator scheduled(config, components, clock, scheduler);
        assert(scheduled.start());
        assert(scheduled.start());
        assert(scheduler->pendingCount() == 1);
        scheduled.stop();
        assert(scheduler->pendingCount() == 0);
    }
    scheduler->stop();

    std::cout << "[OK] CacheOrchestrator health check test\n";
}

void testCacheOrchestratorReport() {
    std::cout << "Testing CacheOrchestrator performance report...\n";

    auto clock = std::make_shared<ManualClock>();
    OrchestratorComponents components;
    components.tier = makeTier(clock);
    components.analytics = std::make_shared<telemetry::CacheAnalytics>(telemetry::TelemetryConfig{}, clock);
    CacheOrchestrator orchestrator(OrchestratorConfig{}, components, clock);

    assert(orchestrator.set("k", 1));
    for (int i = 0; i < 4; ++i) {
        orchestrator.get("k");
    }
    orchestrator.get("missing");

    // cache 80, memory 100, database 0, images 100, predictions 0
    auto report = orchestrator.getPerformanceReport();
    assert(std::abs(report.scores.cache - 80.0) < 1e-9);
    assert(report.scores.memory == 100.0);
    assert(report.scores.database == 0.0);
    assert(report.scores.images == 100.0);
    assert(report.scores.predictions == 0.0);
    assert(report.overallScore == 59);
    assert(report.grade == "F");
    assert(report.status == "critical");
    assert(report.generatedAt == clock->nowMs());
    assert(report.recommendations.size() == 1); // только стратегия предзагрузки
    assert(report.toJson()["grade"] == "F");

    assert(gradeForScore(90) == "A");
    assert(gradeForScore(89) == "B");
    assert(gradeForScore(70) == "C");
    assert(gradeForScore(60) == "D");
    assert(statusForScore(95) == "excellent");
    assert(statusForScore(75) == "fair");
    assert(statusForScore(10) == "critical");

    std::cout << "[OK] CacheOrchestrator report test\n";
}

void testCacheOrchestratorDelegates() {
    std::cout << "Testing CacheOrchestrator delegates without components...\n";

    auto clock = std::make_shared<ManualClock>();
    CacheOrchestrator orchestrator(OrchestratorConfig{}, OrchestratorComponents{}, clock);

    const std::string sql = "SELECT name FROM pets WHERE id = ?";
    auto params = nlohmann::json::array({1});
    bool thrown = false;
    try {
        orchestrator.executeQuery(sql, params);
    } catch (const QueryExecutionError& e) {
        thrown = true;
        assert(e.queryId() == query::makeQueryId(sql, params));
    }
    assert(thrown);

    auto future = orchestrator.batchQuery(sql, params);
    thrown = false;
    try {
        future.get();
    } catch (const QueryExecutionError&) {
        thrown = true;
    }
    assert(thrown);

    // Анализ работает и без оптимизатора
    auto analysis = orchestrator.analyzeQuery("SELECT * FROM pets");
    assert(analysis.issues.size() == 1);

    assert(orchestrator.generatePredictions("home").empty());
    assert(orchestrator.prefetchForRoute("home").empty());
    assert(orchestrator.getActiveAlerts().empty());
    assert(!orchestrator.acknowledgeAlert("alert_1"));
    assert(!orchestrator.set("k", 1));
    assert(!orchestrator.remove("k"));
    orchestrator.recordUserAction("view_pet_profile", nlohmann::json::object(), 10.0);
    orchestrator.trackNavigation("home", "view_pet_profile", 10.0);
    assert(orchestrator.getCurrentMetrics().totalRequests == 0);

    // Формат ключей
    assert(isAssetKey("asset:logo"));
    assert(isAssetKey("fonts/Inter.woff2?v=3"));
    assert(!isAssetKey("pet:1"));
    assert(isQueryKey("  select id from pets"));
    assert(!isQueryKey("selection"));
    assert(queryText("query:SELECT 1") == "SELECT 1");
    assert(isImageKey("a/b/c.JPG"));
    assert(!isImageKey("dir.png/file"));
    assert(cacheLevelFromString(toString(CacheLevel::Cdn)) == CacheLevel::Cdn);
    assert(cacheLevelFromString("bogus") == CacheLevel::Auto);

    OrchestratorConfig invalid;
    invalid.capacityShrinkFactor = 1.5;
    assert(!invalid.validate());
    auto parsed = OrchestratorConfig::fromJson({{"degradationThreshold", 0.5}});
    assert(parsed.degradationThreshold == 0.5);
    assert(parsed.healthCheckIntervalMs == 60000);
    OrchestratorConfig base;
    base.baselineRefreshTicks = 3;
    auto merged = OrchestratorConfig::fromJson(nlohmann::json{{"degradationThreshold", 0.4}}, base);
    assert(merged.baselineRefreshTicks == 3);
    assert(merged.degradationThreshold == 0.4);

    std::cout << "[OK] CacheOrchestrator delegates test\n";
}

int main() {
    try {
        smokeTestCacheOrchestrator();
        testCacheOrchestratorValidationAndCancel();
        testCacheOrchestratorUnusualData();
        testCacheOrchestratorTiers();
        testCacheOrchestratorOptimization();
        testCacheOrchestratorHealthCheck();
        testCacheOrchestratorReport();
        testCacheOrchestratorDelegates();
        std::cout << "All CacheOrchestrator tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheOrchestrator test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

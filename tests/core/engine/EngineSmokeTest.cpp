#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "core/common/Clock.hpp"
#include "core/common/Errors.hpp"
#include "core/config/ConfigLoader.hpp"
#include "core/engine/Engine.hpp"
#include "core/storage/MemoryKeyValueStore.hpp"

using namespace cachepilot::core;
using cachepilot::core::common::ManualClock;
using cachepilot::core::config::ConfigLoader;
using cachepilot::core::engine::Engine;
using cachepilot::core::engine::EngineCollaborators;
using cachepilot::core::engine::EngineConfig;

namespace {

class FakeDatabase : public IDatabaseExecutor {
public:
    std::atomic<int> calls{0};
    nlohmann::json execute(const std::string&, const nlohmann::json&) override {
        ++calls;
        return nlohmann::json::array({{{"id", 1}}});
    }
};

EngineConfig inMemoryConfig() {
    EngineConfig config;
    config.storagePath = "";
    config.logLevel = "warn";
    return config;
}

EngineCollaborators makeCollaborators(std::shared_ptr<ManualClock> clock,
                                      std::shared_ptr<IKeyValueStore> store = nullptr) {
    EngineCollaborators collaborators;
    collaborators.clock = std::move(clock);
    collaborators.store = std::move(store);
    collaborators.database = std::make_shared<FakeDatabase>();
    collaborators.dataLoader = [](const std::string& dataType) { return nlohmann::json{{"dataType", dataType}}; };
    return collaborators;
}

} // namespace

void testConfigLoaderParse() {
    std::cout << "Testing ConfigLoader parsing...\n";

    std::string error;
    auto config = ConfigLoader::parseJsonString(R"({
        "logLevel": "debug",
        "storagePath": "",
        "enablePrediction": false,
        "tier": {"maxMemorySize": 2048, "enableCompression": false},
        "query": {"batchSize": 4, "slowQueryThreshold": 250},
        "orchestrator": {"degradationThreshold": 0.35},
        "predictor": {"actionDataTypes": {"open_map": "map_tiles"}},
        "threadPool": {"minThreads": 1, "maxThreads": 2}
    })", &error);
    assert(config);
    assert(error.empty());
    assert(config->logLevel == "debug");
    assert(config->storagePath.empty());
    assert(!config->enablePrediction);
    assert(config->tier.maxMemorySize == 2048);
    assert(!config->tier.enableCompression);
    assert(config->query.batchSize == 4);
    assert(config->query.slowQueryThreshold == 250.0);
    assert(config->orchestrator.degradationThreshold == 0.35);
    assert(config->predictor.actionDataTypes.size() == 1);
    assert(config->predictor.actionDataTypes.at("open_map") == "map_tiles");
    assert(config->threadPool.maxThreads == 2);

    // Отсутствующие ключи берут значения по умолчанию
    assert(config->tier.maxEntries == 10000);
    assert(config->telemetry.maxEventsHistory == 1000);
    assert(config->query.batchDebounceMs == 100);
    assert(config->predictor.dataTypeSizes.size() == 6);

    auto empty = ConfigLoader::parseJsonString("{}");
    assert(empty);
    assert(empty->storagePath == "cachepilot_data");

    std::cout << "[OK] ConfigLoader parse test\n";
}

void testConfigLoaderRejects() {
    std::cout << "Testing ConfigLoader rejection...\n";

    std::string error;
    assert(!ConfigLoader::parseJsonString(R"({"tier": {"maxMemorySize": "big"}})", &error));
    assert(!error.empty());

    error.clear();
    assert(!ConfigLoader::parseJsonString(R"({"tier": 5})", &error));
    assert(error.find("tier") != std::string::npos);

    error.clear();
    assert(!ConfigLoader::parseJsonString(R"({"logLevel": "verbose"})", &error));
    assert(error.find("logLevel") != std::string::npos);

    error.clear();
    assert(!ConfigLoader::parseJsonString(R"({"threadPool": {"minThreads": 0}})", &error));
    assert(error == "configuration failed validation");

    assert(!ConfigLoader::parseJsonString("{\"tier\": ", &error));
    assert(!ConfigLoader::parseJsonString("[1, 2]", &error));

    error.clear();
    assert(!ConfigLoader::parseJsonFile("/nonexistent/cachepilot.json", &error));
    assert(error.rfind("cannot open", 0) == 0);

    std::cout << "[OK] ConfigLoader rejection test\n";
}

void testConfigLoaderRoundTrip() {
    std::cout << "Testing ConfigLoader round trip...\n";

    EngineConfig config = inMemoryConfig();
    config.tier.defaultTtlMs = 1234;
    config.telemetry.thresholds.hitRatio = 0.6;
    config.query.retentionMs = 5000;
    config.orchestrator.baselineRefreshTicks = 3;
    config.predictor.dataTypeSizes["map_tiles"] = 8192;

    nlohmann::json j = ConfigLoader::toJson(config);
    EngineConfig restored = ConfigLoader::fromJson(j);
    assert(ConfigLoader::toJson(restored) == j);
    assert(restored.tier.defaultTtlMs == 1234);
    assert(restored.telemetry.thresholds.hitRatio == 0.6);
    assert(restored.orchestrator.baselineRefreshTicks == 3);
    assert(restored.predictor.dataTypeSizes.at("map_tiles") == 8192);

    // Через файл
    auto path = std::filesystem::temp_directory_path() / "cachepilot_engine_config_test.json";
    {
        std::ofstream out(path);
        out << j.dump(2);
    }
    auto fromFile = ConfigLoader::parseJsonFile(path.string());
    assert(fromFile);
    assert(fromFile->query.retentionMs == 5000);
    std::filesystem::remove(path);

    std::cout << "[OK] ConfigLoader round trip test\n";
}

void smokeTestEngine() {
    std::cout << "Testing Engine lifecycle...\n";

    auto clock = std::make_shared<ManualClock>();
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    {
        Engine engine(inMemoryConfig(), makeCollaborators(clock, store));
        assert(!engine.isInitialized());
        assert(!engine.orchestrator());

        assert(engine.initialize());
        assert(engine.isInitialized());
        assert(engine.initialize()); // повторный вызов ничего не делает
        assert(engine.orchestrator());
        assert(engine.analytics());
        assert(engine.predictor());
        assert(engine.queryOptimizer());
        assert(engine.tier());
        assert(engine.store() == store);
        assert(engine.scheduler() && engine.scheduler()->isRunning());
        assert(engine.analytics()->isMonitoring());
        // мониторинг, самонастройка, оптимизация запросов, проверка здоровья
        assert(engine.scheduler()->pendingCount() >= 4);

        auto facade = engine.orchestrator();
        orchestrator::GetOptions options;
        options.fallback = []() { return nlohmann::json{{"name", "Rex"}}; };
        assert(facade->get("pet:1", options).source == orchestrator::DataSource::Fallback);
        assert(facade->get("pet:1", options).source == orchestrator::DataSource::Memory);

        auto rows = facade->executeQuery("SELECT id FROM pets WHERE owner_id = ?", nlohmann::json::array({7}));
        assert(rows.size() == 1);
        // pet:1 из fallback и явное действие
        facade->recordUserAction("view_pet_profile", nlohmann::json::object(), 150.0);
        assert(engine.predictor()->getPatterns().size() == 2);

        engine.shutdown();
        assert(!engine.isInitialized());
        assert(!engine.scheduler()->isRunning());
        engine.shutdown();
    }

    // Состояние сохранено при остановке
    assert(store->get("cache_analytics_metrics"));
    assert(store->get("predictive_patterns"));
    assert(store->get("db_optimization_patterns"));

    // Новый движок на том же хранилище поднимает паттерны
    Engine restarted(inMemoryConfig(), makeCollaborators(clock, store));
    assert(restarted.initialize());
    assert(restarted.predictor()->getPatterns().size() == 2);
    assert(restarted.queryOptimizer()->getQueryPatterns().size() == 1);
    restarted.shutdown();

    std::cout << "[OK] Engine smoke test\n";
}

void testEngineOptionalComponents() {
    std::cout << "Testing Engine optional components...\n";

    auto clock = std::make_shared<ManualClock>();

    // Без исполнителя БД и без предсказателя
    EngineConfig config = inMemoryConfig();
    config.enablePrediction = false;
    EngineCollaborators collaborators;
    collaborators.clock = clock;
    Engine engine(config, collaborators);
    assert(engine.initialize());
    assert(!engine.predictor());
    assert(!engine.queryOptimizer());
    bool thrown = false;
    try {
        engine.orchestrator()->executeQuery("SELECT 1");
    } catch (const QueryExecutionError&) {
        thrown = true;
    }
    assert(thrown);
    assert(engine.orchestrator()->prefetchForRoute("home").empty());
    engine.shutdown();

    // Некорректный конфиг
    EngineConfig invalid = inMemoryConfig();
    invalid.threadPool.minThreads = 8;
    invalid.threadPool.maxThreads = 2;
    Engine broken(invalid, collaborators);
    assert(!broken.initialize());
    assert(!broken.isInitialized());
    assert(broken.getConfiguration().threadPool.minThreads == 8);

    // Мониторинг выключен
    EngineConfig quiet = inMemoryConfig();
    quiet.enableMonitoring = false;
    Engine silent(quiet, collaborators);
    assert(silent.initialize());
    assert(!silent.analytics()->isMonitoring());
    silent.shutdown();

    std::cout << "[OK] Engine optional components test\n";
}

int main() {
    try {
        testConfigLoaderParse();
        testConfigLoaderRejects();
        testConfigLoaderRoundTrip();
        smokeTestEngine();
        testEngineOptionalComponents();
        std::cout << "All Engine tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Engine test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

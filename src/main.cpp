#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"
#include "core/config/ConfigLoader.hpp"
#include "core/engine/Engine.hpp"

using namespace cachepilot::core;

// Флаг для корректного завершения
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    spdlog::info("Received signal {}, initiating graceful shutdown...", signal);
    g_running = false;
}

namespace {

// Таблица питомцев вместо настоящей БД
class DemoDatabase : public IDatabaseExecutor {
public:
    nlohmann::json execute(const std::string& sql, const nlohmann::json& params) override {
        static const std::regex writeRe(R"(^\s*(INSERT|UPDATE|DELETE)\b)", std::regex::icase);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (std::regex_search(sql, writeRe)) {
            return {{"affected", 1}};
        }
        if (sql.find("broken") != std::string::npos) {
            throw std::runtime_error("no such table: broken");
        }
        nlohmann::json rows = nlohmann::json::array();
        for (int id = 1; id <= 3; ++id) {
            rows.push_back({{"id", id}, {"name", "pet_" + std::to_string(id)}, {"params", params}});
        }
        return rows;
    }
};

class DemoAssetFetcher : public IAssetFetcher {
public:
    std::optional<nlohmann::json> fetch(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++metrics_.totalRequests;
        nlohmann::json asset = {{"url", key}, {"bytes", 2048}};
        if (registered_.count(key)) {
            ++metrics_.cacheHits;
            metrics_.bytesServed += 2048;
        } else {
            metrics_.bytesDownloaded += 2048;
        }
        return asset;
    }
    void registerAsset(const std::string& key, const nlohmann::json& metadata) override {
        std::lock_guard<std::mutex> lock(mutex_);
        registered_[key] = metadata;
    }
    AssetMetrics getMetrics() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return metrics_;
    }
private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> registered_;
    AssetMetrics metrics_;
};

class DemoImagePipeline : public IImagePipeline {
public:
    void analyzeImage(const std::string& key, const nlohmann::json& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t original = data.value("bytes", size_t{4096});
        stats_.totalImages++;
        stats_.originalBytes += original;
        stats_.compressedBytes += static_cast<size_t>(static_cast<double>(original) * stats_.quality);
        stats_.compressionRatio = static_cast<double>(stats_.compressedBytes) / static_cast<double>(stats_.originalBytes);
        spdlog::debug("[demo] image {} analyzed", key);
    }
    void setCompressionQuality(double quality) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.quality = quality;
    }
    ImageStats getStats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }
private:
    mutable std::mutex mutex_;
    ImageStats stats_;
};

class DemoPoolManager : public IMemoryPoolManager {
public:
    std::vector<MemoryPoolInfo> getPools() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pools_;
    }
    bool compactPool(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pool : pools_) {
            if (pool.name == name) {
                pool.fragmentation = 0.05;
                return true;
            }
        }
        return false;
    }
    size_t collectGarbage() override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t freed = 0;
        for (auto& pool : pools_) {
            size_t release = pool.used / 10;
            pool.used -= release;
            freed += release;
        }
        return freed;
    }
private:
    mutable std::mutex mutex_;
    std::vector<MemoryPoolInfo> pools_ = {
        {"small_objects", 4 * 1024 * 1024, 1024 * 1024, 0.42},
        {"images", 16 * 1024 * 1024, 6 * 1024 * 1024, 0.12}
    };
};

class LogMetricsSink : public IMetricsSink {
public:
    void recordMetric(const std::string& name, double value, int64_t timestamp,
                      const std::string& category, const nlohmann::json& metadata) override {
        spdlog::debug("[metric] {}/{} = {:.2f} at {} {}", category, name, value, timestamp, metadata.dump());
    }
};

void initializeLogging() {
    std::filesystem::create_directories("logs");
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    auto logger = std::make_shared<spdlog::logger>("cachepilot", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::info("=== CachePilot demo starting ===");
}

// Типичная сессия приложения: экраны, запросы, ассеты
void runScenario(engine::Engine& app) {
    auto facade = app.orchestrator();

    orchestrator::GetOptions profile;
    profile.strategy.ttlMs = 60000;
    profile.strategy.priority = Priority::High;
    profile.fallback = []() { return nlohmann::json{{"id", 1}, {"name", "Rex"}, {"species", "dog"}}; };
    for (int i = 0; i < 3; ++i) {
        auto result = facade->get("pet:1", profile);
        spdlog::info("[demo] get pet:1 -> source={}, fromCache={}", orchestrator::toString(result.source), result.fromCache);
    }

    facade->trackNavigation("home", "view_pet_profile", 320.0);
    facade->trackNavigation("view_pet_profile", "view_health_records", 410.0);
    facade->trackNavigation("home", "view_pet_profile", 290.0);
    auto predictions = facade->prefetchForRoute("home");
    spdlog::info("[demo] {} predictions for home", predictions.size());

    auto asset = facade->get("https://cdn.example.com/img/rex.png");
    spdlog::info("[demo] asset -> source={}", orchestrator::toString(asset.source));
    orchestrator::SetOptions photo;
    photo.strategy.compression = true;
    facade->set("photos/rex_large.jpg", {{"mimeType", "image/jpeg"}, {"bytes", 120000}}, photo);

    try {
        facade->executeQuery("SELECT * FROM pets WHERE owner_id = 7");
        facade->executeQuery("SELECT name FROM pets WHERE id = ?", nlohmann::json::array({1}));
        facade->executeQuery("SELECT name FROM pets WHERE id = ?", nlohmann::json::array({1}));
        facade->executeQuery("SELECT * FROM broken");
    } catch (const QueryExecutionError& e) {
        spdlog::warn("[demo] query {} failed: {}", e.queryId(), e.what());
    }

    std::vector<std::future<nlohmann::json>> batch;
    for (int id = 1; id <= 3; ++id) {
        batch.push_back(facade->batchQuery("SELECT name FROM pets WHERE id = ?", nlohmann::json::array({id})));
    }
    for (auto& f : batch) {
        try {
            spdlog::info("[demo] batch result rows: {}", f.get().size());
        } catch (const std::exception& e) {
            spdlog::warn("[demo] batch query failed: {}", e.what());
        }
    }

    auto analysis = facade->analyzeQuery("SELECT * FROM pets WHERE LOWER(name) LIKE '%rex' ORDER BY name");
    spdlog::info("[demo] analysis: {}", analysis.toJson().dump());

    app.analytics()->runMonitoringCycle();
    auto optimization = facade->optimizePerformance();
    for (const auto& action : optimization.actions) {
        spdlog::info("[demo] action: {}", action);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath = "config/cachepilot.json";
    bool serve = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--serve") {
            serve = true;
        } else {
            configPath = arg;
        }
    }

    try {
        initializeLogging();

        std::string error;
        auto loaded = config::ConfigLoader::parseJsonFile(configPath, &error);
        if (!loaded) {
            std::cerr << "Invalid configuration " << configPath << ": " << error << std::endl;
            return 1;
        }

        engine::EngineCollaborators collaborators;
        collaborators.database = std::make_shared<DemoDatabase>();
        collaborators.assets = std::make_shared<DemoAssetFetcher>();
        collaborators.images = std::make_shared<DemoImagePipeline>();
        collaborators.pools = std::make_shared<DemoPoolManager>();
        collaborators.sink = std::make_shared<LogMetricsSink>();
        collaborators.dataLoader = [](const std::string& dataType) {
            return nlohmann::json{{"dataType", dataType}, {"items", nlohmann::json::array()}};
        };

        engine::Engine app(*loaded, collaborators);
        if (!app.initialize()) {
            spdlog::critical("Engine initialization failed");
            return 1;
        }

        runScenario(app);

        if (serve) {
            spdlog::info("Serving, press Ctrl+C to stop");
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        std::cout << app.orchestrator()->getPerformanceReport().toJson().dump(2) << std::endl;
        app.shutdown();
        spdlog::info("=== CachePilot demo shutdown complete ===");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

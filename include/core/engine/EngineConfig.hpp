#pragma once

#include <string>
#include "core/cache/CacheConfig.hpp"
#include "core/orchestrator/OrchestratorTypes.hpp"
#include "core/prediction/PredictionTypes.hpp"
#include "core/query/QueryTypes.hpp"
#include "core/telemetry/TelemetryTypes.hpp"
#include "core/thread/ThreadPool.hpp"

namespace cachepilot {
namespace core {
namespace engine {

// EngineConfig — конфигурация всех компонентов движка
struct EngineConfig {
    std::string logLevel = "info";
    std::string storagePath = "cachepilot_data"; // Пусто = хранилище в памяти
    bool enableMonitoring = true;
    bool enablePrediction = true;
    bool enableQueryOptimization = true;

    cache::CacheConfig tier;
    telemetry::TelemetryConfig telemetry;
    prediction::PredictorConfig predictor;
    query::QueryOptimizerConfig query;
    orchestrator::OrchestratorConfig orchestrator;
    thread::ThreadPoolConfig threadPool;

    bool validate() const {
        return tier.validate() && telemetry.validate() && predictor.validate() &&
               query.validate() && orchestrator.validate() && threadPool.validate();
    }
};

} // namespace engine
} // namespace core
} // namespace cachepilot

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Clock.hpp"
#include "core/interfaces/Collaborators.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/interfaces/IKeyValueStore.hpp"
#include "core/query/QueryTypes.hpp"
#include "core/thread/Scheduler.hpp"
#include "core/thread/ThreadPool.hpp"

namespace cachepilot {
namespace core {
namespace query {

std::string queryCacheKey(const std::string& queryId); // db_query_<id>

/**
 * @brief QueryOptimizer — выполнение запросов с кэшем результатов, анализом и пакетированием
 * @details Результаты кэшируются в тире под db_query_<id>. Статистика ведётся по
 * нормализованному тексту запроса, из неё строятся рекомендации индексов.
 * batchQuery копит запросы до batchSize или до истечения batchDebounceMs и
 * выполняет пакет параллельно на пуле потоков.
 */
class QueryOptimizer {
public:
    QueryOptimizer(const QueryOptimizerConfig& config,
                   std::shared_ptr<common::Clock> clock,
                   std::shared_ptr<IDatabaseExecutor> executor,
                   std::shared_ptr<ICacheTier> tier = nullptr,
                   std::shared_ptr<IKeyValueStore> store = nullptr,
                   std::shared_ptr<IMetricsSink> sink = nullptr,
                   std::shared_ptr<thread::Scheduler> scheduler = nullptr,
                   std::shared_ptr<thread::ThreadPool> pool = nullptr); // Конструктор
    ~QueryOptimizer(); // Деструктор
    QueryOptimizer(const QueryOptimizer&) = delete;
    QueryOptimizer& operator=(const QueryOptimizer&) = delete;

    bool loadStoredData();
    bool start(); // Периодическая оптимизация
    void stop();  // Таймеры отменяются, накопленный пакет выполняется

    // Бросает QueryExecutionError после записи метрик
    nlohmann::json executeQuery(const std::string& sql, const nlohmann::json& params = nlohmann::json::array(),
                                const QueryOptions& options = {});
    std::future<nlohmann::json> batchQuery(const std::string& sql, const nlohmann::json& params = nlohmann::json::array());
    size_t pendingBatchSize() const;

    QueryAnalysis analyzeQuery(const std::string& sql) const;
    PeriodicOptimizationSummary performPeriodicOptimization();

    QueryAnalytics getQueryAnalytics() const;
    std::vector<DatabaseIndex> getIndexRecommendations() const;
    std::vector<QueryOptimizationRule> getOptimizationRules() const;
    std::vector<QueryPattern> getQueryPatterns() const;
    std::vector<QueryMetrics> getQueryMetrics(const std::string& queryId) const;

    bool updateConfiguration(const QueryOptimizerConfig& config); // false, если конфиг некорректен
    QueryOptimizerConfig getConfiguration() const;
    size_t clearQueryCache(); // Кол-во удалённых записей
    void persistData();
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace query
} // namespace core
} // namespace cachepilot

#include "core/query/QueryOptimizer.hpp"
#include "core/query/QueryRules.hpp"
#include "core/common/Errors.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace cachepilot {
namespace core {
namespace query {

namespace {

const char* KEY_PATTERNS = "db_optimization_patterns";
const char* KEY_INDEXES = "db_optimization_indexes";
const char* KEY_CONFIG = "db_optimization_config";
const char* KEY_METRICS = "db_optimization_metrics";
const char* PERSISTED_QUERY_PREFIX = "cache_db_query_";

constexpr size_t PERSISTED_METRICS_PER_QUERY = 10;
constexpr size_t COMPRESS_ROWS_THRESHOLD = 10;
constexpr size_t LOGGED_SQL_LENGTH = 100;
constexpr size_t TOP_SLOW_QUERIES = 10;

size_t resultCountOf(const nlohmann::json& result) {
    return result.is_array() ? result.size() : 1;
}

// Элемент пакета: запрос и обещание результата
struct BatchItem {
    std::string sql;
    nlohmann::json params;
    std::promise<nlohmann::json> promise;
};

} // namespace

std::string queryCacheKey(const std::string& queryId) {
    return "db_query_" + queryId;
}

struct QueryOptimizer::Impl {
    QueryOptimizerConfig config;
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<IDatabaseExecutor> executor;
    std::shared_ptr<ICacheTier> tier;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<IMetricsSink> sink;
    std::shared_ptr<thread::Scheduler> scheduler;
    std::shared_ptr<thread::ThreadPool> pool;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex; // Метрики, паттерны, индексы, конфигурация
    std::unordered_map<std::string, std::deque<QueryMetrics>> metrics;
    std::unordered_map<std::string, QueryPattern> patterns;
    std::vector<DatabaseIndex> indexes;
    std::set<std::string> cachedIds;
    size_t queriesSincePersist = 0;
    std::optional<thread::Scheduler::TaskId> periodicTask;

    std::mutex batchMutex; // Накопитель пакета
    std::vector<std::shared_ptr<BatchItem>> batch;
    std::optional<thread::Scheduler::TaskId> debounceTask;

    Impl(const QueryOptimizerConfig& cfg, std::shared_ptr<common::Clock> clk, std::shared_ptr<IDatabaseExecutor> exec,
         std::shared_ptr<ICacheTier> t, std::shared_ptr<IKeyValueStore> kv, std::shared_ptr<IMetricsSink> ms,
         std::shared_ptr<thread::Scheduler> sch, std::shared_ptr<thread::ThreadPool> p)
        : config(cfg), clock(std::move(clk)), executor(std::move(exec)), tier(std::move(t)), store(std::move(kv)),
          sink(std::move(ms)), scheduler(std::move(sch)), pool(std::move(p)), logger(common::getLogger("query")) {
        if (!clock) {
            clock = std::make_shared<common::SystemClock>();
        }
    }

    // Под mutex
    void updatePattern(const std::string& text, const QueryMetrics& m) {
        auto it = patterns.find(text);
        if (it == patterns.end()) {
            while (!patterns.empty() && patterns.size() >= config.maxPatterns) {
                auto victim = std::min_element(patterns.begin(), patterns.end(), [](const auto& a, const auto& b) {
                    return a.second.lastExecuted < b.second.lastExecuted;
                });
                patterns.erase(victim);
            }
            QueryPattern p;
            p.pattern = text;
            p.cacheable = shouldCacheQuery(text, nlohmann::json::array(), config.maxResultSetSize);
            it = patterns.emplace(text, std::move(p)).first;
        }
        QueryPattern& p = it->second;
        p.frequency += 1;
        double n = static_cast<double>(p.frequency);
        p.averageExecutionTime = (p.averageExecutionTime * (n - 1.0) + m.executionTime) / n;
        p.lastExecuted = m.timestamp;
        p.optimizationScore = patternOptimizationScore(text, p.averageExecutionTime, config.slowQueryThreshold);
        p.indexSuggestions = generateIndexSuggestions(text);
    }

    // Под mutex
    void trackMetrics(const QueryMetrics& m) {
        auto& list = metrics[m.queryId];
        list.push_back(m);
        while (list.size() > config.maxMetricsPerQuery) {
            list.pop_front();
        }
        while (metrics.size() > config.maxTrackedQueries) {
            auto victim = metrics.end();
            for (auto it = metrics.begin(); it != metrics.end(); ++it) {
                if (it->first == m.queryId) {
                    continue;
                }
                if (victim == metrics.end() || it->second.back().timestamp < victim->second.back().timestamp) {
                    victim = it;
                }
            }
            if (victim == metrics.end()) {
                break;
            }
            metrics.erase(victim);
        }
    }

    void recordMetrics(const QueryMetrics& m) {
        bool persist = false;
        double slowThreshold;
        size_t maxResultSet;
        {
            std::lock_guard<std::mutex> lock(mutex);
            trackMetrics(m);
            updatePattern(normalizeQuery(m.sql), m);
            if (++queriesSincePersist >= config.persistEveryNQueries) {
                queriesSincePersist = 0;
                persist = true;
            }
            slowThreshold = config.slowQueryThreshold;
            maxResultSet = config.maxResultSetSize;
        }

        if (m.executionTime > slowThreshold) {
            logger->warn("QueryOptimizer: медленный запрос {} ({:.1f} мс)", m.queryId, m.executionTime);
            if (sink) {
                sink->recordMetric("slow_database_query", m.executionTime, clock->nowMs(), "api", {
                    {"queryId", m.queryId},
                    {"resultCount", m.resultCount},
                    {"sql", m.sql.substr(0, LOGGED_SQL_LENGTH)}
                });
            }
        }
        if (m.resultCount > maxResultSet) {
            logger->warn("QueryOptimizer: большой результат {} ({} строк)", m.queryId, m.resultCount);
        }
        if (persist) {
            persistMetrics();
        }
    }

    void saveKey(const std::string& key, const nlohmann::json& value) {
        if (!store) {
            return;
        }
        try {
            store->set(key, value.dump());
        } catch (const std::exception& e) {
            logger->error("QueryOptimizer: ошибка сохранения {}: {}", key, e.what());
        }
    }

    void persistMetrics() {
        nlohmann::json snapshot = nlohmann::json::object();
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [id, list] : metrics) {
                nlohmann::json recent = nlohmann::json::array();
                size_t start = list.size() > PERSISTED_METRICS_PER_QUERY ? list.size() - PERSISTED_METRICS_PER_QUERY : 0;
                for (size_t i = start; i < list.size(); ++i) {
                    recent.push_back(list[i].toJson());
                }
                snapshot[id] = recent;
            }
        }
        saveKey(KEY_METRICS, snapshot);
    }

    void runBatchItem(const std::shared_ptr<BatchItem>& item, QueryOptimizer* owner) {
        try {
            item->promise.set_value(owner->executeQuery(item->sql, item->params));
        } catch (...) {
            item->promise.set_exception(std::current_exception());
        }
    }

    void flushBatch(QueryOptimizer* owner) {
        std::vector<std::shared_ptr<BatchItem>> items;
        std::optional<thread::Scheduler::TaskId> timer;
        {
            std::lock_guard<std::mutex> lock(batchMutex);
            items.swap(batch);
            timer.swap(debounceTask);
        }
        if (timer && scheduler) {
            scheduler->cancel(*timer);
        }
        if (items.empty()) {
            return;
        }
        logger->debug("QueryOptimizer: выполнение пакета из {} запросов", items.size());
        for (const auto& item : items) {
            auto job = [this, item, owner]() { runBatchItem(item, owner); };
            if (!pool || !pool->enqueue(job)) {
                job();
            }
        }
    }
};

QueryOptimizer::QueryOptimizer(const QueryOptimizerConfig& config,
                               std::shared_ptr<common::Clock> clock,
                               std::shared_ptr<IDatabaseExecutor> executor,
                               std::shared_ptr<ICacheTier> tier,
                               std::shared_ptr<IKeyValueStore> store,
                               std::shared_ptr<IMetricsSink> sink,
                               std::shared_ptr<thread::Scheduler> scheduler,
                               std::shared_ptr<thread::ThreadPool> pool)
    : pImpl(std::make_unique<Impl>(config, std::move(clock), std::move(executor), std::move(tier), std::move(store),
                                   std::move(sink), std::move(scheduler), std::move(pool))) {
    pImpl->logger->info("QueryOptimizer создан: batchSize={}, slowQueryThreshold={} мс",
                        config.batchSize, config.slowQueryThreshold);
}

QueryOptimizer::~QueryOptimizer() {
    stop();
}

bool QueryOptimizer::loadStoredData() {
    if (!pImpl->store) {
        return false;
    }
    try {
        auto stored = pImpl->store->multiGet({KEY_PATTERNS, KEY_INDEXES, KEY_CONFIG, KEY_METRICS});
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [key, value] : stored) {
            if (!value) {
                continue;
            }
            nlohmann::json j = nlohmann::json::parse(*value, nullptr, false);
            if (j.is_discarded()) {
                pImpl->logger->warn("QueryOptimizer: повреждены данные {}", key);
                continue;
            }
            if (key == KEY_PATTERNS && j.is_array()) {
                pImpl->patterns.clear();
                for (const auto& item : j) {
                    QueryPattern p = QueryPattern::fromJson(item);
                    if (!p.pattern.empty()) {
                        pImpl->patterns[p.pattern] = p;
                    }
                }
            } else if (key == KEY_INDEXES && j.is_array()) {
                pImpl->indexes.clear();
                for (const auto& item : j) {
                    pImpl->indexes.push_back(DatabaseIndex::fromJson(item));
                }
            } else if (key == KEY_CONFIG && j.is_object()) {
                QueryOptimizerConfig loaded = QueryOptimizerConfig::fromJson(j, pImpl->config);
                if (loaded.validate()) {
                    pImpl->config = loaded;
                }
            } else if (key == KEY_METRICS && j.is_object()) {
                pImpl->metrics.clear();
                for (auto it = j.begin(); it != j.end(); ++it) {
                    auto& list = pImpl->metrics[it.key()];
                    for (const auto& m : it.value()) {
                        list.push_back(QueryMetrics::fromJson(m));
                    }
                }
            }
        }
        pImpl->logger->info("QueryOptimizer: загружено паттернов {}, индексов {}",
                            pImpl->patterns.size(), pImpl->indexes.size());
        return true;
    } catch (const std::exception& e) {
        pImpl->logger->error("QueryOptimizer: ошибка загрузки: {}", e.what());
        return false;
    }
}

bool QueryOptimizer::start() {
    if (!pImpl->scheduler) {
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->periodicTask) {
        pImpl->periodicTask = pImpl->scheduler->scheduleEvery(pImpl->config.optimizationIntervalMs,
            [this]() { performPeriodicOptimization(); }, "query_periodic_optimization");
    }
    return true;
}

void QueryOptimizer::stop() {
    std::optional<thread::Scheduler::TaskId> periodic;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        periodic.swap(pImpl->periodicTask);
    }
    if (periodic && pImpl->scheduler) {
        pImpl->scheduler->cancel(*periodic);
    }
    pImpl->flushBatch(this);
    if (pImpl->pool) {
        pImpl->pool->waitForCompletion();
    }
}

nlohmann::json QueryOptimizer::executeQuery(const std::string& sql, const nlohmann::json& params,
                                            const QueryOptions& options) {
    int64_t started = pImpl->clock->nowMs();
    std::string queryId = makeQueryId(sql, params);
    QueryOptimizerConfig cfg = getConfiguration();
    bool caching = options.useCache && cfg.enableQueryCaching && pImpl->tier;

    auto makeMetrics = [&](const std::string& text, size_t count, bool hit) {
        QueryMetrics m;
        m.queryId = queryId;
        m.sql = text;
        m.executionTime = static_cast<double>(pImpl->clock->nowMs() - started);
        m.resultCount = count;
        m.cacheHit = hit;
        m.timestamp = pImpl->clock->nowMs();
        m.parameters = params;
        return m;
    };

    if (caching) {
        try {
            auto cached = pImpl->tier->get(queryCacheKey(queryId));
            if (cached) {
                pImpl->recordMetrics(makeMetrics(sql, resultCountOf(*cached), true));
                return *cached;
            }
        } catch (const std::exception& e) {
            pImpl->logger->warn("QueryOptimizer: ошибка чтения кэша {}: {}", queryId, e.what());
        }
    }

    std::string optimizedSql = sql;
    if (options.enableOptimization && cfg.enableQueryRewriting) {
        optimizedSql = applyAutoFixes(sql);
        if (optimizedSql != sql) {
            pImpl->logger->debug("QueryOptimizer: запрос {} переписан: {}", queryId, optimizedSql);
        }
    }

    nlohmann::json result;
    try {
        if (!pImpl->executor) {
            throw std::runtime_error("исполнитель запросов не задан");
        }
        result = pImpl->executor->execute(optimizedSql, params);
    } catch (const std::exception& e) {
        QueryMetrics failed = makeMetrics(sql, 0, false);
        failed.errorMessage = e.what();
        pImpl->recordMetrics(failed);
        pImpl->logger->error("QueryOptimizer: ошибка запроса {}: {}", queryId, e.what());
        throw QueryExecutionError(queryId, e.what());
    } catch (...) {
        QueryMetrics failed = makeMetrics(sql, 0, false);
        failed.errorMessage = "unknown executor error";
        pImpl->recordMetrics(failed);
        pImpl->logger->error("QueryOptimizer: неизвестная ошибка запроса {}", queryId);
        throw QueryExecutionError(queryId, *failed.errorMessage);
    }

    if (options.maxResults > 0 && result.is_array() && result.size() > options.maxResults) {
        result.erase(result.begin() + static_cast<std::ptrdiff_t>(options.maxResults), result.end());
    }

    if (caching && options.cancel.isCancelled()) {
        pImpl->logger->debug("QueryOptimizer: запрос {} отменён, результат не кэшируется", queryId);
    } else if (caching && shouldCacheQuery(sql, result, cfg.maxResultSetSize)) {
        TierSetOptions setOptions;
        setOptions.ttlMs = options.cacheTtlMs > 0 ? options.cacheTtlMs : cfg.cacheTtlMs;
        setOptions.priority = Priority::Medium;
        setOptions.compression = result.is_array() && result.size() > COMPRESS_ROWS_THRESHOLD;
        try {
            if (pImpl->tier->set(queryCacheKey(queryId), result, setOptions)) {
                std::lock_guard<std::mutex> lock(pImpl->mutex);
                pImpl->cachedIds.insert(queryId);
            }
        } catch (const std::exception& e) {
            pImpl->logger->warn("QueryOptimizer: не удалось закэшировать {}: {}", queryId, e.what());
        }
    }

    pImpl->recordMetrics(makeMetrics(optimizedSql, resultCountOf(result), false));
    return result;
}

std::future<nlohmann::json> QueryOptimizer::batchQuery(const std::string& sql, const nlohmann::json& params) {
    QueryOptimizerConfig cfg = getConfiguration();
    if (!cfg.enableBatching) {
        std::promise<nlohmann::json> direct;
        try {
            direct.set_value(executeQuery(sql, params));
        } catch (...) {
            direct.set_exception(std::current_exception());
        }
        return direct.get_future();
    }

    auto item = std::make_shared<BatchItem>();
    item->sql = sql;
    item->params = params;
    std::future<nlohmann::json> result = item->promise.get_future();

    bool flushNow = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->batchMutex);
        pImpl->batch.push_back(item);
        if (pImpl->batch.size() >= cfg.batchSize || !pImpl->scheduler) {
            flushNow = true;
        } else if (!pImpl->debounceTask) {
            pImpl->debounceTask = pImpl->scheduler->scheduleOnce(cfg.batchDebounceMs,
                [this]() { pImpl->flushBatch(this); }, "query_batch_flush");
        }
    }
    if (flushNow) {
        pImpl->flushBatch(this);
    }
    return result;
}

size_t QueryOptimizer::pendingBatchSize() const {
    std::lock_guard<std::mutex> lock(pImpl->batchMutex);
    return pImpl->batch.size();
}

QueryAnalysis QueryOptimizer::analyzeQuery(const std::string& sql) const {
    return query::analyzeQuery(sql);
}

PeriodicOptimizationSummary QueryOptimizer::performPeriodicOptimization() {
    PeriodicOptimizationSummary summary;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const QueryOptimizerConfig& cfg = pImpl->config;

        std::map<std::string, uint64_t> weights;
        for (const auto& [text, p] : pImpl->patterns) {
            if (p.frequency > 10 && p.averageExecutionTime > cfg.slowQueryThreshold) {
                ++summary.slowFrequentPatterns;
            }
            if (p.optimizationScore < 5.0) {
                ++summary.poorlyOptimizedPatterns;
            }
            if (p.frequency > 5) {
                for (const auto& suggestion : p.indexSuggestions) {
                    weights[suggestion] += p.frequency;
                }
            }
        }
        if (summary.slowFrequentPatterns > 0) {
            pImpl->logger->warn("QueryOptimizer: частых медленных запросов {}", summary.slowFrequentPatterns);
        }
        if (summary.poorlyOptimizedPatterns > 0) {
            pImpl->logger->warn("QueryOptimizer: плохо оптимизированных запросов {}", summary.poorlyOptimizedPatterns);
        }

        std::vector<std::pair<std::string, uint64_t>> ranked(weights.begin(), weights.end());
        std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
        if (ranked.size() > cfg.maxIndexRecommendations) {
            ranked.resize(cfg.maxIndexRecommendations);
        }
        pImpl->indexes.clear();
        uint64_t topUsage = ranked.empty() ? 0 : ranked.front().second;
        for (const auto& [suggestion, usage] : ranked) {
            auto index = parseIndexSuggestion(suggestion, usage);
            if (!index) {
                continue;
            }
            index->effectiveness = std::round(100.0 * static_cast<double>(usage) / static_cast<double>(topUsage)) / 10.0;
            pImpl->indexes.push_back(*index);
        }
        summary.indexRecommendations = pImpl->indexes.size();

        int64_t cutoff = pImpl->clock->nowMs() - cfg.retentionMs;
        for (auto it = pImpl->metrics.begin(); it != pImpl->metrics.end();) {
            auto& list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(), [cutoff](const QueryMetrics& m) {
                return m.timestamp <= cutoff;
            }), list.end());
            if (list.empty()) {
                it = pImpl->metrics.erase(it);
                ++summary.purgedQueries;
            } else {
                ++it;
            }
        }
        for (auto it = pImpl->patterns.begin(); it != pImpl->patterns.end();) {
            if (it->second.lastExecuted < cutoff && it->second.frequency < 5) {
                it = pImpl->patterns.erase(it);
                ++summary.purgedPatterns;
            } else {
                ++it;
            }
        }
    }
    pImpl->logger->info("QueryOptimizer: периодическая оптимизация, индексов {}, удалено запросов {}, паттернов {}",
                        summary.indexRecommendations, summary.purgedQueries, summary.purgedPatterns);
    persistData();
    return summary;
}

QueryAnalytics QueryOptimizer::getQueryAnalytics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    QueryAnalytics analytics;
    double totalTime = 0.0;
    size_t hits = 0;
    for (const auto& [id, list] : pImpl->metrics) {
        for (const auto& m : list) {
            ++analytics.totalQueries;
            totalTime += m.executionTime;
            if (m.executionTime > pImpl->config.slowQueryThreshold) {
                ++analytics.slowQueries;
            }
            if (m.cacheHit) {
                ++hits;
            }
        }
    }
    if (analytics.totalQueries > 0) {
        analytics.averageExecutionTime = totalTime / static_cast<double>(analytics.totalQueries);
        analytics.cacheHitRate = static_cast<double>(hits) / static_cast<double>(analytics.totalQueries);
    }

    double scoreSum = 0.0;
    for (const auto& [text, p] : pImpl->patterns) {
        scoreSum += p.optimizationScore;
        if (p.averageExecutionTime > pImpl->config.slowQueryThreshold) {
            analytics.topSlowQueries.push_back({p.pattern, p.averageExecutionTime, p.frequency});
        }
    }
    std::sort(analytics.topSlowQueries.begin(), analytics.topSlowQueries.end(),
              [](const SlowQuerySummary& a, const SlowQuerySummary& b) { return a.avgTime > b.avgTime; });
    if (analytics.topSlowQueries.size() > TOP_SLOW_QUERIES) {
        analytics.topSlowQueries.resize(TOP_SLOW_QUERIES);
    }
    analytics.optimizationScore = pImpl->patterns.empty()
        ? 10.0 : scoreSum / static_cast<double>(pImpl->patterns.size());
    return analytics;
}

std::vector<DatabaseIndex> QueryOptimizer::getIndexRecommendations() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->indexes;
}

std::vector<QueryOptimizationRule> QueryOptimizer::getOptimizationRules() const {
    return optimizationRules();
}

std::vector<QueryPattern> QueryOptimizer::getQueryPatterns() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<QueryPattern> result;
    for (const auto& [text, p] : pImpl->patterns) {
        result.push_back(p);
    }
    std::sort(result.begin(), result.end(), [](const QueryPattern& a, const QueryPattern& b) {
        return a.frequency > b.frequency;
    });
    return result;
}

std::vector<QueryMetrics> QueryOptimizer::getQueryMetrics(const std::string& queryId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->metrics.find(queryId);
    if (it == pImpl->metrics.end()) {
        return {};
    }
    return std::vector<QueryMetrics>(it->second.begin(), it->second.end());
}

bool QueryOptimizer::updateConfiguration(const QueryOptimizerConfig& config) {
    if (!config.validate()) {
        pImpl->logger->warn("QueryOptimizer: отклонена некорректная конфигурация");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->config = config;
    }
    pImpl->saveKey(KEY_CONFIG, config.toJson());
    return true;
}

QueryOptimizerConfig QueryOptimizer::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

size_t QueryOptimizer::clearQueryCache() {
    std::set<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ids.swap(pImpl->cachedIds);
    }
    size_t removed = 0;
    if (pImpl->tier) {
        for (const auto& id : ids) {
            if (pImpl->tier->remove(queryCacheKey(id))) {
                ++removed;
            }
        }
    }
    if (pImpl->store) {
        try {
            std::vector<std::string> persisted;
            for (const auto& key : pImpl->store->getAllKeys()) {
                if (key.rfind(PERSISTED_QUERY_PREFIX, 0) == 0) {
                    persisted.push_back(key);
                }
            }
            if (!persisted.empty()) {
                pImpl->store->multiRemove(persisted);
            }
        } catch (const std::exception& e) {
            pImpl->logger->error("QueryOptimizer: ошибка очистки хранилища: {}", e.what());
        }
    }
    pImpl->logger->info("QueryOptimizer: кэш запросов очищен, удалено {}", removed);
    return removed;
}

void QueryOptimizer::persistData() {
    nlohmann::json patterns = nlohmann::json::array();
    nlohmann::json indexes = nlohmann::json::array();
    nlohmann::json config;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [text, p] : pImpl->patterns) {
            patterns.push_back(p.toJson());
        }
        for (const auto& idx : pImpl->indexes) {
            indexes.push_back(idx.toJson());
        }
        config = pImpl->config.toJson();
    }
    pImpl->saveKey(KEY_PATTERNS, patterns);
    pImpl->saveKey(KEY_INDEXES, indexes);
    pImpl->saveKey(KEY_CONFIG, config);
    pImpl->persistMetrics();
}

} // namespace query
} // namespace core
} // namespace cachepilot

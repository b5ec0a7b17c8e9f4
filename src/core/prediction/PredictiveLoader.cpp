#include "core/prediction/PredictiveLoader.hpp"
#include "core/prediction/PatternScoring.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace cachepilot {
namespace core {
namespace prediction {

namespace {

const char* KEY_PATTERNS = "predictive_patterns";
const char* KEY_METRICS = "predictive_metrics";

constexpr size_t COMPRESSION_SIZE_THRESHOLD = 4096;
constexpr double SUCCESS_LOAD_TIME_MS = 5000.0;

int hourOf(int64_t ms) {
    return static_cast<int>((ms / common::MS_PER_HOUR) % 24);
}

// 1970-01-01 был четвергом
int weekdayOf(int64_t ms) {
    return static_cast<int>((ms / common::MS_PER_DAY + 4) % 7);
}

} // namespace

std::string prefetchKey(const std::string& dataType) {
    return "prefetch:" + dataType;
}

struct PredictiveLoader::Impl {
    PredictorConfig config;
    std::shared_ptr<common::Clock> clock;
    std::shared_ptr<ICacheTier> tier;
    DataLoader loader;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<IMetricsSink> sink;
    std::shared_ptr<thread::Scheduler> scheduler;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::unordered_map<std::string, PredictivePattern> patterns;
    LoadingContext context;
    LoadingMetrics metrics;
    std::set<std::string> lastPredicted;
    std::deque<PredictionResult> queue; // preemptive
    std::set<thread::Scheduler::TaskId> timers; // background и дренаж очереди
    std::optional<thread::Scheduler::TaskId> selfTuneTask;
    bool enabled = true;
    bool backgrounded = false;
    bool networkConnected = true;
    bool draining = false;
    std::atomic<bool> processing{false};

    Impl(const PredictorConfig& cfg, std::shared_ptr<common::Clock> clk, std::shared_ptr<ICacheTier> t,
         DataLoader l, std::shared_ptr<IKeyValueStore> kv, std::shared_ptr<IMetricsSink> ms,
         std::shared_ptr<thread::Scheduler> sch)
        : config(cfg), clock(std::move(clk)), tier(std::move(t)), loader(std::move(l)), store(std::move(kv)),
          sink(std::move(ms)), scheduler(std::move(sch)), logger(common::getLogger("predictor")) {
        if (!clock) {
            clock = std::make_shared<common::SystemClock>();
        }
        int64_t now = clock->nowMs();
        context.timestamp = now;
        context.timeOfDay = hourOf(now);
        context.dayOfWeek = weekdayOf(now);
    }

    // Под mutex
    uint64_t maxFrequency() const {
        uint64_t result = 0;
        for (const auto& [id, p] : patterns) {
            result = std::max(result, p.frequency);
        }
        return result;
    }

    // Под mutex: вытесняет давно не использованные паттерны до limit
    void enforceCapacity(size_t limit) {
        while (!patterns.empty() && patterns.size() > limit) {
            auto victim = std::min_element(patterns.begin(), patterns.end(), [](const auto& a, const auto& b) {
                return a.second.lastUsed < b.second.lastUsed;
            });
            logger->debug("PredictiveLoader: паттерн {} вытеснен", victim->first);
            patterns.erase(victim);
        }
    }

    nlohmann::json patternsJson() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& [id, p] : patterns) {
            arr.push_back(p.toJson());
        }
        return arr;
    }

    void saveKey(const std::string& key, const nlohmann::json& value) {
        if (!store) {
            return;
        }
        try {
            store->set(key, value.dump());
        } catch (const std::exception& e) {
            logger->error("PredictiveLoader: ошибка сохранения {}: {}", key, e.what());
        }
    }

    void persistPatterns() {
        nlohmann::json snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            snapshot = patternsJson();
        }
        saveKey(KEY_PATTERNS, snapshot);
    }

    // Вне mutex. Исключение означает неудачную загрузку
    void loadPrediction(const PredictionResult& prediction) {
        auto started = std::chrono::steady_clock::now();
        std::string key = prefetchKey(prediction.dataType);
        if (tier && tier->get(key)) {
            logger->debug("PredictiveLoader: {} уже в кэше", prediction.dataType);
            return;
        }
        nlohmann::json data = loader ? loader(prediction.dataType) : nlohmann::json::object();
        if (tier) {
            TierSetOptions options;
            options.ttlMs = prediction.cacheDurationMs;
            options.priority = prediction.strategy.priority;
            options.compression = prediction.estimatedSize > COMPRESSION_SIZE_THRESHOLD;
            if (!tier->set(key, data, options)) {
                throw std::runtime_error("тир отклонил запись " + key);
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            metrics.totalDataPreloaded += prediction.estimatedSize;
        }
        if (sink) {
            double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
            sink->recordMetric("predictive_load", elapsed, clock->nowMs(), "api", {
                {"dataType", prediction.dataType},
                {"probability", prediction.probability},
                {"strategy", toString(prediction.strategy.type)}
            });
        }
    }

    // Загрузка с учётом успеха/неудачи, ошибки не пробрасываются
    void runOne(const PredictionResult& prediction) {
        bool ok = true;
        try {
            loadPrediction(prediction);
        } catch (const std::exception& e) {
            ok = false;
            logger->warn("PredictiveLoader: не удалось загрузить {}: {}", prediction.dataType, e.what());
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (ok) {
            ++metrics.successfulPredictions;
        } else {
            ++metrics.failedPredictions;
        }
    }

    // Под mutex
    bool canDrain() const {
        return enabled && backgrounded && networkConnected && !queue.empty();
    }

    void startDraining() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (draining || !canDrain()) {
                return;
            }
            draining = true;
        }
        logger->debug("PredictiveLoader: запуск обработки очереди preemptive");
        drainStep();
    }

    // Одна запись очереди за шаг, следующий шаг через preemptiveIntervalMs
    void drainStep() {
        while (true) {
            PredictionResult item;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (!canDrain()) {
                    draining = false;
                    return;
                }
                item = queue.front();
                queue.pop_front();
            }
            runOne(item);

            if (!scheduler) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex);
            if (!canDrain()) {
                draining = false;
                return;
            }
            auto holder = std::make_shared<thread::Scheduler::TaskId>(0);
            *holder = scheduler->scheduleOnce(config.preemptiveIntervalMs, [this, holder]() {
                {
                    std::lock_guard<std::mutex> inner(mutex);
                    timers.erase(*holder);
                }
                drainStep();
            }, "predictive_preemptive");
            timers.insert(*holder);
            return;
        }
    }
};

PredictiveLoader::PredictiveLoader(const PredictorConfig& config,
                                   std::shared_ptr<common::Clock> clock,
                                   std::shared_ptr<ICacheTier> tier,
                                   DataLoader loader,
                                   std::shared_ptr<IKeyValueStore> store,
                                   std::shared_ptr<IMetricsSink> sink,
                                   std::shared_ptr<thread::Scheduler> scheduler)
    : pImpl(std::make_unique<Impl>(config, std::move(clock), std::move(tier), std::move(loader),
                                   std::move(store), std::move(sink), std::move(scheduler))) {
    pImpl->logger->info("PredictiveLoader создан: maxPatterns={}", config.maxPatterns);
}

PredictiveLoader::~PredictiveLoader() {
    stop();
}

bool PredictiveLoader::loadStoredData() {
    if (!pImpl->store) {
        return false;
    }
    try {
        auto stored = pImpl->store->multiGet({KEY_PATTERNS, KEY_METRICS});
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [key, value] : stored) {
            if (!value) {
                continue;
            }
            nlohmann::json j = nlohmann::json::parse(*value, nullptr, false);
            if (j.is_discarded()) {
                pImpl->logger->warn("PredictiveLoader: повреждены данные {}", key);
                continue;
            }
            if (key == KEY_PATTERNS && j.is_array()) {
                pImpl->patterns.clear();
                for (const auto& item : j) {
                    PredictivePattern p = PredictivePattern::fromJson(item);
                    if (!p.id.empty()) {
                        pImpl->patterns[p.id] = p;
                    }
                }
                pImpl->enforceCapacity(pImpl->config.maxPatterns);
            } else if (key == KEY_METRICS && j.is_object()) {
                pImpl->metrics = LoadingMetrics::fromJson(j);
            }
        }
        pImpl->logger->info("PredictiveLoader: загружено паттернов {}", pImpl->patterns.size());
        return true;
    } catch (const std::exception& e) {
        pImpl->logger->error("PredictiveLoader: ошибка загрузки: {}", e.what());
        return false;
    }
}

bool PredictiveLoader::start() {
    if (!pImpl->scheduler) {
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->selfTuneTask) {
        pImpl->selfTuneTask = pImpl->scheduler->scheduleEvery(pImpl->config.selfTuneIntervalMs,
                                                              [this]() { runSelfTuning(); }, "predictive_self_tuning");
    }
    return true;
}

void PredictiveLoader::stop() {
    std::set<thread::Scheduler::TaskId> timers;
    std::optional<thread::Scheduler::TaskId> selfTune;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        timers.swap(pImpl->timers);
        selfTune.swap(pImpl->selfTuneTask);
        pImpl->draining = false;
    }
    if (!pImpl->scheduler) {
        return;
    }
    for (auto id : timers) {
        pImpl->scheduler->cancel(id);
    }
    if (selfTune) {
        pImpl->scheduler->cancel(*selfTune);
    }
}

void PredictiveLoader::updateContext(const ContextUpdate& update) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    LoadingContext& c = pImpl->context;
    int64_t now = pImpl->clock->nowMs();
    if (update.route) c.route = *update.route;
    if (update.userId) c.userId = *update.userId;
    if (update.networkType) c.networkType = *update.networkType;
    if (update.batteryLevel) c.batteryLevel = std::clamp(*update.batteryLevel, 0.0, 1.0);
    if (update.isCharging) c.isCharging = *update.isCharging;
    if (update.appVersion) c.appVersion = *update.appVersion;
    c.timeOfDay = update.timeOfDay ? *update.timeOfDay : hourOf(now);
    c.dayOfWeek = update.dayOfWeek ? *update.dayOfWeek : weekdayOf(now);
    c.timestamp = now;
}

LoadingContext PredictiveLoader::getContext() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->context;
}

void PredictiveLoader::recordUserAction(const std::string& action, const nlohmann::json& data, double loadTimeMs) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        int64_t now = pImpl->clock->nowMs();
        const LoadingContext& context = pImpl->context;
        std::string id = patternId(context, action);
        bool success = loadTimeMs > 0.0 && loadTimeMs < SUCCESS_LOAD_TIME_MS;

        auto it = pImpl->patterns.find(id);
        if (it != pImpl->patterns.end()) {
            PredictivePattern& p = it->second;
            p.frequency += 1;
            p.lastUsed = now;
            double n = static_cast<double>(p.frequency);
            p.successRate = (p.successRate * (n - 1.0) + (success ? 1.0 : 0.0)) / n;
            if (loadTimeMs > 0.0) {
                p.averageLoadTime = (p.averageLoadTime * (n - 1.0) + loadTimeMs) / n;
            }
        } else {
            PredictivePattern p;
            p.id = id;
            p.sequence = {action};
            p.context = context;
            p.successRate = success ? 1.0 : 0.0;
            p.averageLoadTime = std::max(loadTimeMs, 0.0);
            p.lastUsed = now;
            pImpl->enforceCapacity(pImpl->config.maxPatterns - 1);
            it = pImpl->patterns.emplace(id, std::move(p)).first;
        }
        {
            it->second.confidence = patternConfidence(it->second, pImpl->maxFrequency(), context, now);
            pImpl->logger->debug("PredictiveLoader: action={} pattern={} freq={} conf={:.3f} payload={}",
                                 action, id, it->second.frequency, it->second.confidence, data.size());
        }
    }
    pImpl->persistPatterns();
}

std::vector<PredictionResult> PredictiveLoader::generatePredictions(const std::string& route) {
    auto started = std::chrono::steady_clock::now();
    std::vector<PredictionResult> predictions;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->enabled) {
            return {};
        }
        int64_t now = pImpl->clock->nowMs();
        pImpl->context.route = route;
        pImpl->context.timestamp = now;
        const LoadingContext& context = pImpl->context;

        struct Candidate {
            const PredictivePattern* pattern;
            double similarity;
        };
        std::vector<Candidate> candidates;
        for (const auto& [id, p] : pImpl->patterns) {
            bool recent = now - p.lastUsed <= pImpl->config.patternMaxAgeMs;
            double similarity = contextSimilarity(p.context, context);
            if (recent && similarity > pImpl->config.minSimilarity) {
                candidates.push_back({&p, similarity});
            }
        }
        std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return a.pattern->confidence > b.pattern->confidence;
        });

        for (const auto& c : candidates) {
            if (c.pattern->confidence < pImpl->config.minConfidence || c.pattern->sequence.empty()) {
                continue;
            }
            auto mapped = pImpl->config.actionDataTypes.find(c.pattern->sequence.front());
            if (mapped == pImpl->config.actionDataTypes.end()) {
                continue;
            }
            PredictionResult r;
            r.dataType = mapped->second;
            r.probability = c.pattern->confidence * c.similarity;
            r.strategy = determineStrategy(*c.pattern, context, r.probability);
            r.estimatedSize = estimateDataSize(r.dataType, c.pattern->frequency, pImpl->config.dataTypeSizes);
            r.cacheDurationMs = cacheDuration(*c.pattern, context);
            predictions.push_back(std::move(r));
        }

        std::stable_sort(predictions.begin(), predictions.end(), [](const PredictionResult& a, const PredictionResult& b) {
            if (a.strategy.priority != b.strategy.priority) {
                return a.strategy.priority > b.strategy.priority;
            }
            return a.probability > b.probability;
        });
        size_t limit = maxPredictions(context);
        if (predictions.size() > limit) {
            predictions.resize(limit);
        }

        pImpl->metrics.totalPredictions += predictions.size();
        pImpl->lastPredicted.clear();
        for (const auto& p : predictions) {
            pImpl->lastPredicted.insert(p.dataType);
        }
    }

    if (pImpl->sink) {
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        pImpl->sink->recordMetric("prediction_generation", elapsed, pImpl->clock->nowMs(), "api",
                                  {{"predictionsCount", predictions.size()}, {"route", route}});
    }
    pImpl->logger->debug("PredictiveLoader: {} предсказаний для {}", predictions.size(), route);
    return predictions;
}

void PredictiveLoader::executePredictiveLoading(const std::vector<PredictionResult>& predictions) {
    if (!isEnabled() || pImpl->processing.exchange(true)) {
        return;
    }

    std::vector<PredictionResult> background;
    std::vector<PredictionResult> preemptive;
    for (const auto& p : predictions) {
        switch (p.strategy.type) {
            case StrategyType::Immediate:
                pImpl->runOne(p);
                break;
            case StrategyType::Background:
                background.push_back(p);
                break;
            case StrategyType::Preemptive:
                preemptive.push_back(p);
                break;
            case StrategyType::OnDemand:
                break; // Загружается только по запросу
        }
    }

    for (size_t i = 0; i < background.size(); ++i) {
        if (!pImpl->scheduler) {
            pImpl->runOne(background[i]);
            continue;
        }
        auto holder = std::make_shared<thread::Scheduler::TaskId>(0);
        PredictionResult prediction = background[i];
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        *holder = pImpl->scheduler->scheduleOnce(static_cast<int64_t>(i) * pImpl->config.backgroundStaggerMs,
            [this, holder, prediction]() {
                {
                    std::lock_guard<std::mutex> inner(pImpl->mutex);
                    pImpl->timers.erase(*holder);
                }
                pImpl->runOne(prediction);
            }, "predictive_background");
        pImpl->timers.insert(*holder);
    }

    if (!preemptive.empty()) {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            pImpl->queue.insert(pImpl->queue.end(), preemptive.begin(), preemptive.end());
        }
        pImpl->startDraining();
    }
    pImpl->processing = false;
}

bool PredictiveLoader::hasPredictionFor(const std::string& dataType) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->lastPredicted.count(dataType) > 0;
}

void PredictiveLoader::setAppBackgrounded(bool backgrounded) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->backgrounded = backgrounded;
    }
    if (backgrounded) {
        pImpl->startDraining();
    }
}

void PredictiveLoader::setNetworkConnected(bool connected) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->networkConnected = connected;
    }
    if (connected) {
        pImpl->startDraining();
    }
}

void PredictiveLoader::runSelfTuning() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        LoadingMetrics& m = pImpl->metrics;
        double successRate = m.totalPredictions > 0
            ? static_cast<double>(m.successfulPredictions) / static_cast<double>(m.totalPredictions) : 0.0;
        if (successRate < 0.6) {
            for (auto& [id, p] : pImpl->patterns) {
                p.confidence *= 0.9;
            }
        } else if (successRate > 0.8) {
            for (auto& [id, p] : pImpl->patterns) {
                if (p.successRate > 0.7) {
                    p.confidence = std::min(p.confidence * 1.1, 1.0);
                }
            }
        }
        m.averagePredictionAccuracy = successRate;
        pImpl->logger->info("PredictiveLoader: самонастройка, успешность {:.2f}", successRate);
    }

    cleanupOldPatterns();

    if (pImpl->tier) {
        TierStatistics stats = pImpl->tier->getStatistics();
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->metrics.cacheHitImprovement = stats.hitRate;
        pImpl->metrics.networkSavings = static_cast<double>(pImpl->metrics.totalDataPreloaded) * stats.hitRate;
    }
    persistData();
}

size_t PredictiveLoader::cleanupOldPatterns() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        int64_t cutoff = pImpl->clock->nowMs() - pImpl->config.patternMaxAgeMs;
        for (auto it = pImpl->patterns.begin(); it != pImpl->patterns.end();) {
            if (it->second.lastUsed < cutoff && it->second.confidence < pImpl->config.minConfidence) {
                it = pImpl->patterns.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        pImpl->logger->info("PredictiveLoader: удалено устаревших паттернов {}", removed);
    }
    pImpl->persistPatterns();
    return removed;
}

void PredictiveLoader::enable() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->enabled = true;
}

void PredictiveLoader::disable() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->enabled = false;
    pImpl->queue.clear();
}

bool PredictiveLoader::isEnabled() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->enabled;
}

LoadingMetrics PredictiveLoader::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    LoadingMetrics m = pImpl->metrics;
    m.patternsCount = pImpl->patterns.size();
    m.queueLength = pImpl->queue.size();
    return m;
}

double PredictiveLoader::getPredictionAccuracy() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    uint64_t done = pImpl->metrics.successfulPredictions + pImpl->metrics.failedPredictions;
    return done > 0 ? static_cast<double>(pImpl->metrics.successfulPredictions) / static_cast<double>(done) : 0.0;
}

std::vector<PredictivePattern> PredictiveLoader::getPatterns() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<PredictivePattern> result;
    result.reserve(pImpl->patterns.size());
    for (const auto& [id, p] : pImpl->patterns) {
        result.push_back(p);
    }
    std::sort(result.begin(), result.end(), [](const PredictivePattern& a, const PredictivePattern& b) {
        return a.confidence > b.confidence;
    });
    return result;
}

void PredictiveLoader::clearAllPatterns() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->patterns.clear();
        pImpl->lastPredicted.clear();
    }
    pImpl->persistPatterns();
}

void PredictiveLoader::persistData() {
    nlohmann::json patterns, metrics;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        patterns = pImpl->patternsJson();
        metrics = pImpl->metrics.toJson();
    }
    pImpl->saveKey(KEY_PATTERNS, patterns);
    pImpl->saveKey(KEY_METRICS, metrics);
}

} // namespace prediction
} // namespace core
} // namespace cachepilot

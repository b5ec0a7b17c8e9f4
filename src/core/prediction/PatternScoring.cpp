#include "core/prediction/PatternScoring.hpp"
#include "core/common/Hash.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace cachepilot {
namespace core {
namespace prediction {

namespace {

constexpr double DAYS_DECAY = 7.0;
constexpr int64_t BASE_CACHE_DURATION_MS = common::MS_PER_HOUR;
constexpr int64_t MAX_CACHE_DURATION_MS = common::MS_PER_DAY;
constexpr size_t DEFAULT_DATA_SIZE = 1024;

} // namespace

std::string patternId(const LoadingContext& context, const std::string& action) {
    std::string raw = context.route + "_" + std::to_string(context.timeOfDay) + "_" +
                      std::to_string(context.dayOfWeek) + "_" + action;
    return common::shortHash(raw, 16);
}

double recencyScore(int64_t lastUsed, int64_t now) {
    double days = static_cast<double>(now - lastUsed) / static_cast<double>(common::MS_PER_DAY);
    return std::exp(-days / DAYS_DECAY);
}

double contextSimilarity(const LoadingContext& pattern, const LoadingContext& current) {
    double similarity = 0.0;
    int factors = 0;

    // Время суток по 12-часовой шкале
    similarity += std::max(0.0, 1.0 - std::abs(pattern.timeOfDay - current.timeOfDay) / 12.0);
    ++factors;

    similarity += pattern.dayOfWeek == current.dayOfWeek ? 1.0 : 0.0;
    ++factors;

    if (!pattern.networkType.empty()) {
        similarity += pattern.networkType == current.networkType ? 1.0 : 0.0;
        ++factors;
    }
    if (!pattern.route.empty()) {
        similarity += pattern.route == current.route ? 1.0 : 0.0;
        ++factors;
    }
    return similarity / factors;
}

double patternConfidence(const PredictivePattern& pattern, uint64_t maxFrequency,
                         const LoadingContext& current, int64_t now) {
    double frequencyScore = maxFrequency > 0
        ? static_cast<double>(pattern.frequency) / static_cast<double>(maxFrequency) : 0.0;
    double confidence = frequencyScore * 0.4 +
                        recencyScore(pattern.lastUsed, now) * 0.25 +
                        contextSimilarity(pattern.context, current) * 0.2 +
                        pattern.successRate * 0.15;
    return std::clamp(confidence, 0.0, 1.0);
}

LoadingStrategy determineStrategy(const PredictivePattern& pattern, const LoadingContext& context, double probability) {
    LoadingStrategy s;
    if (probability > 0.8) {
        s.type = StrategyType::Immediate;
        s.priority = Priority::High;
    } else if (probability > 0.6) {
        s.type = StrategyType::Background;
        s.priority = Priority::Medium;
    } else if (probability > 0.4) {
        s.type = StrategyType::OnDemand;
        s.priority = Priority::Low;
    } else {
        s.type = StrategyType::Preemptive;
        s.priority = Priority::Low;
    }

    // Мобильная сеть без зарядки
    if (context.networkType == "cellular" && !context.isCharging) {
        if (s.type == StrategyType::Immediate) s.type = StrategyType::Background;
        if (s.priority == Priority::High) s.priority = Priority::Medium;
    }
    if (context.batteryLevel < 0.2) {
        s.type = StrategyType::OnDemand;
        s.priority = Priority::Low;
    }

    s.batchSize = s.type == StrategyType::Immediate ? 1 : 3;
    s.retryCount = s.priority == Priority::High ? 3 : 1;
    s.timeoutMs = pattern.averageLoadTime > 0.0 ? pattern.averageLoadTime * 1.5 : 5000.0;
    s.networkDependent = true;
    return s;
}

size_t estimateDataSize(const std::string& dataType, uint64_t frequency, const std::map<std::string, size_t>& baseSizes) {
    auto it = baseSizes.find(dataType);
    size_t base = it != baseSizes.end() ? it->second : DEFAULT_DATA_SIZE;
    double multiplier = std::min(static_cast<double>(frequency) / 10.0, 2.0);
    return static_cast<size_t>(std::lround(static_cast<double>(base) * multiplier));
}

int64_t cacheDuration(const PredictivePattern& pattern, const LoadingContext& context) {
    double duration = static_cast<double>(BASE_CACHE_DURATION_MS);
    if (pattern.confidence > 0.8) {
        duration *= 2.0;
    }
    if (pattern.frequency > 10) {
        duration *= 1.5;
    }
    if (context.batteryLevel < 0.3) {
        duration *= 0.5;
    }
    return std::min(static_cast<int64_t>(duration), MAX_CACHE_DURATION_MS);
}

size_t maxPredictions(const LoadingContext& context) {
    size_t limit = 5;
    if (context.networkType == "wifi") {
        limit = 10;
    } else if (context.networkType == "cellular") {
        limit = 3;
    }
    if (context.batteryLevel < 0.3) {
        limit = std::min<size_t>(limit, 2);
    }
    return limit;
}

} // namespace prediction
} // namespace core
} // namespace cachepilot

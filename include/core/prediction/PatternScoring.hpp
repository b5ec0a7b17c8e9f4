#pragma once

#include <map>
#include <string>
#include "core/prediction/PredictionTypes.hpp"

namespace cachepilot {
namespace core {
namespace prediction {

// Чистые функции оценки паттернов. Время передаётся явно

std::string patternId(const LoadingContext& context, const std::string& action); // 16 hex SHA-256

double recencyScore(int64_t lastUsed, int64_t now); // e^(-дней/7)
double contextSimilarity(const LoadingContext& pattern, const LoadingContext& current);

// 0.4*freq/maxFreq + 0.25*recency + 0.2*similarity + 0.15*successRate, не выше 1
double patternConfidence(const PredictivePattern& pattern, uint64_t maxFrequency,
                         const LoadingContext& current, int64_t now);

LoadingStrategy determineStrategy(const PredictivePattern& pattern, const LoadingContext& context, double probability);
size_t estimateDataSize(const std::string& dataType, uint64_t frequency, const std::map<std::string, size_t>& baseSizes);
int64_t cacheDuration(const PredictivePattern& pattern, const LoadingContext& context);
size_t maxPredictions(const LoadingContext& context);

} // namespace prediction
} // namespace core
} // namespace cachepilot

#include <cassert>
#include <cmath>
#include <iostream>
#include "core/prediction/PatternScoring.hpp"

using namespace cachepilot::core;
using namespace cachepilot::core::prediction;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

LoadingContext makeContext(const std::string& route, int hour, int day, const std::string& network) {
    LoadingContext c;
    c.route = route;
    c.timeOfDay = hour;
    c.dayOfWeek = day;
    c.networkType = network;
    return c;
}

} // namespace

void testPatternIdAndRecency() {
    std::cout << "Testing pattern id and recency...\n";

    auto home = makeContext("home", 9, 1, "wifi");
    std::string id = patternId(home, "view_pet_profile");
    assert(id.size() == 16);
    assert(id == patternId(home, "view_pet_profile"));
    assert(id != patternId(home, "view_photos"));
    // Сеть в идентификатор не входит
    assert(id == patternId(makeContext("home", 9, 1, "cellular"), "view_pet_profile"));

    int64_t now = 1700000000000LL;
    assert(near(recencyScore(now, now), 1.0));
    assert(near(recencyScore(now - 7 * common::MS_PER_DAY, now), std::exp(-1.0)));

    std::cout << "[OK] pattern id and recency test\n";
}

void testContextSimilarity() {
    std::cout << "Testing context similarity...\n";

    auto pattern = makeContext("home", 10, 3, "wifi");
    assert(near(contextSimilarity(pattern, pattern), 1.0));

    // Полдня разницы, другой маршрут
    auto current = makeContext("settings", 16, 3, "wifi");
    assert(near(contextSimilarity(pattern, current), 2.5 / 4.0));

    // Пустые сеть и маршрут не учитываются
    auto bare = makeContext("", 16, 3, "");
    assert(near(contextSimilarity(bare, current), 1.0));

    std::cout << "[OK] context similarity test\n";
}

void testPatternConfidence() {
    std::cout << "Testing pattern confidence...\n";

    int64_t now = 1700000000000LL;
    PredictivePattern p;
    p.context = makeContext("home", 9, 1, "wifi");
    p.frequency = 10;
    p.successRate = 1.0;
    p.lastUsed = now;

    double full = patternConfidence(p, 10, p.context, now);
    assert(full <= 1.0);
    assert(near(full, 1.0));

    double half = patternConfidence(p, 20, p.context, now);
    assert(near(half, 0.8));

    p.successRate = 0.0;
    p.lastUsed = now - 365 * common::MS_PER_DAY;
    double stale = patternConfidence(p, 10, makeContext("other", 21, 5, "cellular"), now);
    assert(stale >= 0.0 && stale < 0.5);

    std::cout << "[OK] pattern confidence test\n";
}

void testDetermineStrategy() {
    std::cout << "Testing loading strategy selection...\n";

    PredictivePattern p;
    p.averageLoadTime = 200.0;
    auto wifi = makeContext("home", 9, 1, "wifi");

    auto s = determineStrategy(p, wifi, 0.9);
    assert(s.type == StrategyType::Immediate);
    assert(s.priority == Priority::High);
    assert(s.batchSize == 1);
    assert(s.retryCount == 3);
    assert(near(s.timeoutMs, 300.0));

    assert(determineStrategy(p, wifi, 0.7).type == StrategyType::Background);
    assert(determineStrategy(p, wifi, 0.5).type == StrategyType::OnDemand);
    assert(determineStrategy(p, wifi, 0.3).type == StrategyType::Preemptive);

    // Мобильная сеть без зарядки понижает immediate
    auto cellular = makeContext("home", 9, 1, "cellular");
    s = determineStrategy(p, cellular, 0.9);
    assert(s.type == StrategyType::Background);
    assert(s.priority == Priority::Medium);
    cellular.isCharging = true;
    assert(determineStrategy(p, cellular, 0.9).type == StrategyType::Immediate);

    // Низкий заряд: только по запросу
    wifi.batteryLevel = 0.1;
    s = determineStrategy(p, wifi, 0.95);
    assert(s.type == StrategyType::OnDemand);
    assert(s.priority == Priority::Low);

    PredictivePattern fresh;
    assert(near(determineStrategy(fresh, makeContext("home", 9, 1, "wifi"), 0.9).timeoutMs, 5000.0));

    std::cout << "[OK] loading strategy test\n";
}

void testSizeDurationAndLimits() {
    std::cout << "Testing size, duration and prediction limits...\n";

    PredictorConfig config;
    assert(estimateDataSize("photo_gallery_data", 30, config.dataTypeSizes) == 102400);
    assert(estimateDataSize("pet_profile_data", 5, config.dataTypeSizes) == 1024);
    assert(estimateDataSize("unknown_data", 10, config.dataTypeSizes) == 1024);

    PredictivePattern p;
    p.confidence = 0.9;
    p.frequency = 11;
    LoadingContext c;
    assert(cacheDuration(p, c) == 3 * common::MS_PER_HOUR);
    c.batteryLevel = 0.2;
    assert(cacheDuration(p, c) == 90 * common::MS_PER_MINUTE);
    p.confidence = 0.5;
    p.frequency = 1;
    c.batteryLevel = 1.0;
    assert(cacheDuration(p, c) == common::MS_PER_HOUR);

    assert(maxPredictions(makeContext("home", 9, 1, "wifi")) == 10);
    assert(maxPredictions(makeContext("home", 9, 1, "cellular")) == 3);
    assert(maxPredictions(makeContext("home", 9, 1, "unknown")) == 5);
    auto weak = makeContext("home", 9, 1, "wifi");
    weak.batteryLevel = 0.2;
    assert(maxPredictions(weak) == 2);

    std::cout << "[OK] size, duration and limits test\n";
}

int main() {
    try {
        testPatternIdAndRecency();
        testContextSimilarity();
        testPatternConfidence();
        testDetermineStrategy();
        testSizeDurationAndLimits();
        std::cout << "All PatternScoring tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "PatternScoring test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

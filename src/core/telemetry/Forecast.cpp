#include "core/telemetry/Forecast.hpp"

namespace cachepilot {
namespace core {
namespace telemetry {

double linearForecast(const std::vector<double>& values, int steps) {
    if (values.empty()) {
        return 0.0;
    }
    size_t offset = values.size() > FORECAST_WINDOW ? values.size() - FORECAST_WINDOW : 0;
    std::vector<double> window(values.begin() + static_cast<std::ptrdiff_t>(offset), values.end());
    if (window.size() < 2) {
        return window[0];
    }

    const double n = static_cast<double>(window.size());
    double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumXX = 0.0;
    for (size_t i = 0; i < window.size(); ++i) {
        double x = static_cast<double>(i);
        sumX += x;
        sumY += window[i];
        sumXY += x * window[i];
        sumXX += x * x;
    }

    double slope = (n * sumXY - sumX * sumY) / (n * sumXX - sumX * sumX);
    double intercept = (sumY - slope * sumX) / n;
    return intercept + slope * (n - 1.0 + static_cast<double>(steps));
}

std::vector<MetricForecast> forecastTrend(const std::vector<CacheMetrics>& history) {
    std::vector<MetricForecast> result;
    if (history.size() < FORECAST_MIN_POINTS) {
        return result;
    }
    std::vector<double> hit, memory, response;
    for (const auto& m : history) {
        hit.push_back(m.hitRatio);
        memory.push_back(m.memoryUtilization);
        response.push_back(m.totalResponseTime);
    }
    for (int step = 1; step <= FORECAST_STEPS; ++step) {
        MetricForecast f;
        f.step = step;
        f.hitRatio = linearForecast(hit, step);
        f.memoryUtilization = linearForecast(memory, step);
        f.totalResponseTime = linearForecast(response, step);
        result.push_back(f);
    }
    return result;
}

} // namespace telemetry
} // namespace core
} // namespace cachepilot

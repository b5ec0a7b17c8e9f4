#pragma once

#include <vector>
#include "core/telemetry/TelemetryTypes.hpp"

namespace cachepilot {
namespace core {
namespace telemetry {

constexpr size_t FORECAST_WINDOW = 5;  // Точек для регрессии
constexpr int FORECAST_STEPS = 3;      // Шагов вперёд
constexpr size_t FORECAST_MIN_POINTS = 3;

// МНК по индексам i=0..n-1 для последних FORECAST_WINDOW значений:
// intercept + slope * (n - 1 + steps). При n < 2 возвращает values[0] или 0.
double linearForecast(const std::vector<double>& values, int steps);

// Прогноз hitRatio / memoryUtilization / totalResponseTime на FORECAST_STEPS шагов.
// Пусто, если в тренде меньше FORECAST_MIN_POINTS точек.
std::vector<MetricForecast> forecastTrend(const std::vector<CacheMetrics>& history);

} // namespace telemetry
} // namespace core
} // namespace cachepilot

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Clock.hpp"
#include "core/interfaces/Collaborators.hpp"
#include "core/interfaces/ICacheTier.hpp"
#include "core/interfaces/IKeyValueStore.hpp"
#include "core/prediction/PredictionTypes.hpp"
#include "core/thread/Scheduler.hpp"

namespace cachepilot {
namespace core {
namespace prediction {

// Загрузчик данных для предсказанного типа. Исключение = неудачная загрузка
using DataLoader = std::function<nlohmann::json(const std::string& dataType)>;

// Ключ тира для предзагруженных данных
std::string prefetchKey(const std::string& dataType);

/**
 * @brief PredictiveLoader — обучение на действиях пользователя и предзагрузка данных
 * @details Паттерны (маршрут, час, день недели, действие) получают уверенность по частоте,
 * давности, схожести контекста и успешности. Предсказания исполняются по стратегии:
 * immediate в вызывающем потоке, background через планировщик со сдвигом,
 * preemptive из очереди, пока приложение в фоне и есть сеть.
 */
class PredictiveLoader {
public:
    PredictiveLoader(const PredictorConfig& config,
                     std::shared_ptr<common::Clock> clock,
                     std::shared_ptr<ICacheTier> tier,
                     DataLoader loader,
                     std::shared_ptr<IKeyValueStore> store = nullptr,
                     std::shared_ptr<IMetricsSink> sink = nullptr,
                     std::shared_ptr<thread::Scheduler> scheduler = nullptr); // Конструктор
    ~PredictiveLoader(); // Деструктор
    PredictiveLoader(const PredictiveLoader&) = delete;
    PredictiveLoader& operator=(const PredictiveLoader&) = delete;

    bool loadStoredData(); // Паттерны и метрики из хранилища
    bool start(); // Периодическая самонастройка
    void stop();  // Отменить все таймеры

    void updateContext(const ContextUpdate& update);
    LoadingContext getContext() const;

    void recordUserAction(const std::string& action, const nlohmann::json& data, double loadTimeMs);
    std::vector<PredictionResult> generatePredictions(const std::string& route);
    void executePredictiveLoading(const std::vector<PredictionResult>& predictions);
    bool hasPredictionFor(const std::string& dataType) const; // В последнем наборе предсказаний

    void setAppBackgrounded(bool backgrounded);
    void setNetworkConnected(bool connected);

    void runSelfTuning();
    size_t cleanupOldPatterns(); // Кол-во удалённых

    void enable();
    void disable(); // Очищает очередь preemptive
    bool isEnabled() const;

    LoadingMetrics getMetrics() const;
    double getPredictionAccuracy() const; // Доля успешных загрузок
    std::vector<PredictivePattern> getPatterns() const;
    void clearAllPatterns();
    void persistData();
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace prediction
} // namespace core
} // namespace cachepilot

#pragma once

#include <string>
#include <vector>

namespace gateway::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "signals_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * @note Ключи перечислены заранее в getAllKeys(): сериализация
 *       идёт по этому списку, чтобы нулевые счётчики тоже попадали в вывод.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return Ключи в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace gateway::settings

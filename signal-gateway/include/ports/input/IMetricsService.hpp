#pragma once

#include <string>
#include <map>

namespace gateway::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Определяет контракт для сбора и сериализации метрик в формате Prometheus.
 * Поддерживает только counter метрики с опциональными labels.
 *
 * @example
 * ```cpp
 * metricsService->increment("signals_total", {{"status", "ok"}});
 * std::string output = metricsService->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Сериализовать метрики в Prometheus формат (text 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace gateway::ports::input

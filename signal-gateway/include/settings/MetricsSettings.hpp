#pragma once

#include "settings/IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace gateway::settings {

/**
 * @brief Набор метрик шлюза
 *
 * - HTTP метрики (method + path)
 * - signals_total по итоговому статусу
 * - upstream_degraded_total по источнику (balance / positions)
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"signals_total", "Processed signals by final status", "counter"},
            {"upstream_degraded_total", "Degraded upstream readings by source", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            "http_requests_total{method=\"GET\",path=\"/\"}",
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"POST\",path=\"/webhook\"}",
            "http_requests_total{method=\"POST\",path=\"/dryrun\"}",
            "http_requests_total{method=\"GET\",path=\"/risk-status\"}",
            "http_requests_total{method=\"GET\",path=\"/env-check\"}",

            "signals_total{status=\"ok\"}",
            "signals_total{status=\"partial\"}",
            "signals_total{status=\"error\"}",
            "signals_total{status=\"ignored\"}",
            "signals_total{status=\"skipped\"}",
            "signals_total{status=\"rejected\"}",

            "upstream_degraded_total{source=\"balance\"}",
            "upstream_degraded_total{source=\"positions\"}"
        };
    }
};

} // namespace gateway::settings

#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>

namespace gateway::adapters::primary {

/**
 * @brief GET /metrics — счётчики в формате Prometheus text 0.0.4
 *
 * @example Response:
 * ```
 * # HELP signals_total Processed signals by final status
 * # TYPE signals_total counter
 * signals_total{status="ok"} 42
 * ```
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace gateway::adapters::primary

// adapters/primary/MetricsMiddleware.hpp
#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>

namespace serverlib
{

    /**
     * @brief Middleware для подсчёта HTTP метрик
     *
     * Метрика: http_requests_total{method="...",path="..."}
     * Статус ответа не трогает — цепочка идёт дальше.
     */
    class MetricsMiddleware : public IHttpHandler
    {
    public:
        explicit MetricsMiddleware(
            std::shared_ptr<gateway::ports::input::IMetricsService> metrics) : metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string path = req.getPathPattern();
            if (path.empty())
            {
                path = req.getPath();
            }
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", path}});
        }

    private:
        std::shared_ptr<gateway::ports::input::IMetricsService> metrics_;
    };

} // namespace serverlib

#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "settings/IGatewaySettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace gateway::adapters::primary {

/**
 * @brief GET /health — процесс жив, плюс текущий режим исполнения
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::IGatewaySettings> settings)
        : settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "signal-gateway";
        response["version"] = "1.0.0";
        response["dry_run"] = settings_->isDryRun();
        response["trading_enabled"] = settings_->isTradingEnabled();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::IGatewaySettings> settings_;
};

} // namespace gateway::adapters::primary

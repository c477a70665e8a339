#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IRiskStatusService.hpp"
#include "adapters/primary/SignalJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary
{

    /**
     * @brief GET /risk-status — баланс, лимиты и вердикты guard'ов на текущий момент
     */
    class RiskStatusHandler : public IHttpHandler
    {
    public:
        explicit RiskStatusHandler(std::shared_ptr<ports::input::IRiskStatusService> service)
            : service_(std::move(service))
        {
            std::cout << "[RiskStatusHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            try
            {
                auto status = service_->snapshot();
                const auto &policy = status.policy;

                nlohmann::json j;
                j["balance"] = status.balance.amount;
                j["balance_degraded"] = status.balance.degraded;
                j["MAX_RISK_PCT"] = policy.maxRiskPct;
                j["MAX_UNITS"] = policy.maxUnits;
                j["SYMBOL_ALLOWLIST"] = policy.allowList;
                j["SYMBOL_RISK_CAPS"] = policy.instrumentUnitCaps;
                j["SYMBOL_MAX_RISK_PCT"] = policy.instrumentRiskCaps;
                j["SYMBOL_MIN_STOP"] = policy.instrumentMinStop;
                j["MAX_OPEN_POSITIONS"] = policy.maxOpenPositions;
                j["MAX_OPEN_PER_SYMBOL"] = policy.maxOpenPerInstrument;
                j["SYMBOL_MAX_OPEN"] = policy.instrumentMaxOpen;
                j["open_positions"] = {
                    {"total", status.positions.total},
                    {"per_instrument", status.positions.perInstrument},
                    {"degraded", status.positions.degraded}};
                j["trading_window"] = policy.tradingWindow;
                j["trading_window_ok"] = status.tradingWindowOk;
                j["daily_loss_ok"] = status.dailyLoss.ok;
                j["daily_loss_info"] = SignalJson::dailyLoss(status.dailyLoss);

                res.setResult(200, "application/json", j.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[RiskStatusHandler] Error: " << e.what() << std::endl;
                nlohmann::json error;
                error["status"] = "error";
                error["message"] = e.what();
                res.setResult(500, "application/json", error.dump());
            }
        }

    private:
        std::shared_ptr<ports::input::IRiskStatusService> service_;
    };

} // namespace gateway::adapters::primary

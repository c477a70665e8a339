#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ISignalService.hpp"
#include "settings/IGatewaySettings.hpp"
#include "adapters/primary/SignalJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary
{

    /**
     * @brief POST /webhook — приём торгового сигнала
     *
     * HTTP статусы:
     * - 200: ok / partial / skipped / ignored
     * - 400: пустое тело, некорректный JSON, нет side/symbol/price
     * - 403: сигнал отклонён guard'ом
     * - 500: все цели исполнения провалились или внутренняя ошибка
     */
    class WebhookHandler : public IHttpHandler
    {
    public:
        WebhookHandler(
            std::shared_ptr<ports::input::ISignalService> signalService,
            std::shared_ptr<settings::IGatewaySettings> gatewaySettings) : signalService_(std::move(signalService)), gatewaySettings_(std::move(gatewaySettings))
        {
            std::cout << "[WebhookHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            nlohmann::json body;
            try
            {
                body = nlohmann::json::parse(req.getBody());
            }
            catch (const nlohmann::json::exception &)
            {
                sendError(res, 400, "No data received");
                return;
            }
            if (!body.is_object() || body.empty())
            {
                sendError(res, 400, "No data received");
                return;
            }

            try
            {
                auto record = signalService_->process(SignalJson::parseSignal(body));
                res.setResult(httpStatus(record), "application/json", toJson(record).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WebhookHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, e.what());
            }
        }

        static int httpStatus(const domain::AuditRecord &record)
        {
            switch (record.status)
            {
            case domain::SignalStatus::REJECTED:
                return record.guard == "validation" ? 400 : 403;
            case domain::SignalStatus::ERROR:
                return 500;
            default:
                return 200;
            }
        }

    private:
        std::shared_ptr<ports::input::ISignalService> signalService_;
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;

        nlohmann::json toJson(const domain::AuditRecord &r) const
        {
            nlohmann::json j;
            j["status"] = domain::toString(r.status);
            j["order_id"] = r.orderId;
            j["tv_symbol"] = r.rawSymbol;
            j["instrument"] = r.instrument;
            j["side"] = r.side ? nlohmann::json(domain::toString(*r.side)) : nlohmann::json(nullptr);
            j["entry"] = SignalJson::optionalNumber(r.price);
            j["slPrice"] = SignalJson::optionalNumber(r.stopPrice);
            j["tpPrice"] = SignalJson::optionalNumber(r.targetPrice);
            j["sent_units"] = r.units ? nlohmann::json(*r.units) : nlohmann::json(nullptr);
            j["risk_pct_requested"] = r.requestedRiskPct;
            j["risk_pct_applied"] = SignalJson::optionalNumber(r.appliedRiskPct);
            j["dry_run"] = gatewaySettings_->isDryRun();
            j["trading_enabled"] = gatewaySettings_->isTradingEnabled();

            for (const auto &o : r.outcomes)
            {
                j[o.target] = SignalJson::outcome(o);
            }
            if (!r.reason.empty())
            {
                j["reason"] = r.reason;
            }
            if (!r.guard.empty())
            {
                j["guard"] = r.guard;
            }
            if (r.balance)
            {
                j["balance_degraded"] = r.balanceDegraded;
            }
            return j;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["status"] = "error";
            error["message"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace gateway::adapters::primary

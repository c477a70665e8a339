#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ISignalService.hpp"
#include "adapters/primary/SignalJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary
{

    /**
     * @brief POST /dryrun — расчёт маппинга, SL/TP и объёма без отправки ордеров
     *
     * Пустые поля заполняются значениями по умолчанию:
     * US30 BUY @ 39250, SL 150 points, TP 300 points, risk 0.05%.
     * Не проходит дедупликацию и не пишется в аудит.
     */
    class DryRunHandler : public IHttpHandler
    {
    public:
        explicit DryRunHandler(std::shared_ptr<ports::input::ISignalService> signalService)
            : signalService_(std::move(signalService))
        {
            std::cout << "[DryRunHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            nlohmann::json body = nlohmann::json::object();
            if (!req.getBody().empty())
            {
                try
                {
                    body = nlohmann::json::parse(req.getBody());
                }
                catch (const nlohmann::json::exception &)
                {
                    sendError(res, 400, "Invalid JSON");
                    return;
                }
                if (!body.is_object())
                {
                    body = nlohmann::json::object();
                }
            }

            try
            {
                auto signal = withDefaults(body);
                auto report = signalService_->preview(signal);

                if (!report.allowed)
                {
                    sendError(res, 400, "Symbol " + signal.rawSymbol + " not allowed");
                    return;
                }

                nlohmann::json j;
                j["side"] = domain::toString(report.side);
                j["tv_symbol"] = report.rawSymbol;
                j["instrument"] = report.instrument;
                j["entry"] = report.entry;
                j["slPrice"] = SignalJson::optionalNumber(report.stopPrice);
                j["tpPrice"] = SignalJson::optionalNumber(report.targetPrice);
                j["risk_pct_requested"] = report.requestedRiskPct;
                j["risk_pct_applied"] = report.appliedRiskPct;
                j["units"] = report.units;
                j["trading_window_ok"] = report.tradingWindowOk;
                j["daily_loss_ok"] = report.dailyLoss.ok;
                j["daily_loss_info"] = SignalJson::dailyLoss(report.dailyLoss);
                j["open_positions_total"] = report.openPositionsTotal;
                j["open_positions_for_instrument"] = report.openPositionsForInstrument;
                j["note"] = "dry run only; nothing sent";

                res.setResult(200, "application/json", j.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DryRunHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, e.what());
            }
        }

        static domain::Signal withDefaults(const nlohmann::json &body)
        {
            domain::Signal signal = SignalJson::parseSignal(body);
            if (!signal.side)
            {
                signal.side = domain::Side::BUY;
            }
            if (signal.rawSymbol.empty())
            {
                signal.rawSymbol = "US30";
            }
            if (!signal.price || *signal.price == 0.0)
            {
                signal.price = 39250.0;
            }
            if (!signal.stop)
            {
                signal.stop = domain::Distance{150.0, domain::UnitKind::POINTS};
            }
            if (!signal.target)
            {
                signal.target = domain::Distance{300.0, domain::UnitKind::POINTS};
            }
            return signal;
        }

    private:
        std::shared_ptr<ports::input::ISignalService> signalService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["status"] = "error";
            error["message"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace gateway::adapters::primary

#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "settings/IGatewaySettings.hpp"
#include "settings/IRiskSettings.hpp"
#include "settings/IBrokerClientSettings.hpp"
#include "settings/ICopyTradeSettings.hpp"
#include "settings/INotifierSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace gateway::adapters::primary
{

    /**
     * @brief GET /env-check — действующая конфигурация, секреты замаскированы
     */
    class EnvCheckHandler : public IHttpHandler
    {
    public:
        EnvCheckHandler(
            std::shared_ptr<settings::IGatewaySettings> gateway,
            std::shared_ptr<settings::IRiskSettings> risk,
            std::shared_ptr<settings::IBrokerClientSettings> broker,
            std::shared_ptr<settings::ICopyTradeSettings> copyTrade,
            std::shared_ptr<settings::INotifierSettings> notifier)
            : gateway_(std::move(gateway)), risk_(std::move(risk)), broker_(std::move(broker)), copyTrade_(std::move(copyTrade)), notifier_(std::move(notifier))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            const auto &policy = risk_->getPolicy();

            nlohmann::json j;
            j["LOCAL_TEST"] = gateway_->isDryRun();
            j["TRADING_ENABLED"] = gateway_->isTradingEnabled();
            j["FORWARD_TO_OANDA"] = gateway_->isBrokerForwardingEnabled();
            j["FORWARD_TO_DUPLIKIUM"] = gateway_->isCopyTradeForwardingEnabled();
            j["DAILY_LOSS_STOP_PCT"] = policy.dailyLossStopPct;
            j["TRADING_TZ"] = policy.timeZone;
            j["TRADING_WINDOW"] = policy.tradingWindow;
            j["MAX_RISK_PCT"] = policy.maxRiskPct;
            j["MAX_UNITS"] = policy.maxUnits;
            j["MASTER_START_BAL"] = policy.fallbackBalance;
            j["SYMBOL_ALLOWLIST"] = policy.allowList;
            j["SYMBOL_RISK_CAPS"] = policy.instrumentUnitCaps;
            j["OANDA_HOST"] = broker_->getHost();
            j["OANDA_ACCOUNT_ID"] = broker_->getAccountId();
            j["OANDA_TOKEN"] = mask(broker_->getToken());
            j["DUPLIKIUM_HOST"] = copyTrade_->getHost();
            j["DUPLIKIUM_USER"] = copyTrade_->getUser();
            j["DUPLIKIUM_TOKEN"] = mask(copyTrade_->getToken());
            j["DUPLIKIUM_AUTH_STYLE"] = copyTrade_->getAuthStyle();
            j["DUPLIKIUM_ORDERS_PATH"] = copyTrade_->getOrdersPath();
            j["DISCORD_WEBHOOK_SET"] = !notifier_->getHost().empty() && !notifier_->getPath().empty();

            res.setResult(200, "application/json", j.dump());
        }

        /**
         * @brief "abcd...wxyz" для значений длиннее 8 символов, "***" для коротких, null для пустых
         */
        static nlohmann::json mask(const std::string &value)
        {
            if (value.empty())
                return nullptr;
            if (value.size() > 8)
                return value.substr(0, 4) + "..." + value.substr(value.size() - 4);
            return "***";
        }

    private:
        std::shared_ptr<settings::IGatewaySettings> gateway_;
        std::shared_ptr<settings::IRiskSettings> risk_;
        std::shared_ptr<settings::IBrokerClientSettings> broker_;
        std::shared_ptr<settings::ICopyTradeSettings> copyTrade_;
        std::shared_ptr<settings::INotifierSettings> notifier_;
    };

} // namespace gateway::adapters::primary

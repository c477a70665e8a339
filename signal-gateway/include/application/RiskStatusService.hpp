#pragma once

#include "ports/input/IRiskStatusService.hpp"
#include "application/GuardContextProvider.hpp"
#include "application/SymbolResolver.hpp"
#include "application/guards/AdmissionGuards.hpp"
#include "settings/IRiskSettings.hpp"
#include <memory>

namespace gateway::application {

/**
 * @brief Текущее состояние риск-контуров без обработки сигнала
 */
class RiskStatusService : public ports::input::IRiskStatusService {
public:
    RiskStatusService(
        std::shared_ptr<GuardContextProvider> contextProvider,
        std::shared_ptr<SymbolResolver> resolver,
        std::shared_ptr<settings::IRiskSettings> riskSettings
    ) : contextProvider_(std::move(contextProvider))
      , policy_(resolver->canonicalize(riskSettings->getPolicy()))
    {}

    domain::RiskStatus snapshot() override {
        auto ctx = contextProvider_->build("", std::nullopt);

        domain::RiskStatus status;
        status.balance = ctx.balance;
        status.positions = ctx.positions;
        status.policy = policy_;
        status.tradingWindowOk = guards::withinTradingWindow(policy_.tradingWindow, ctx.localTime);
        status.dailyLoss = guards::evaluateDailyLoss(ctx, policy_);
        return status;
    }

private:
    std::shared_ptr<GuardContextProvider> contextProvider_;
    domain::RiskPolicy policy_;
};

} // namespace gateway::application

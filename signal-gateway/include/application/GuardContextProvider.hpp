#pragma once

#include "application/DailyBaseline.hpp"
#include "ports/output/IBalanceOracle.hpp"
#include "ports/output/IPositionCensus.hpp"
#include "ports/output/IClock.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/IGatewaySettings.hpp"
#include "domain/GuardContext.hpp"
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace gateway::application {

/**
 * @brief Сборка GuardContext для одного сигнала
 *
 * Опрашивает баланс, позиции, часы и daily baseline. Деградация upstream
 * не прерывает обработку: она попадает в контекст, лог и метрику.
 */
class GuardContextProvider {
public:
    GuardContextProvider(
        std::shared_ptr<ports::output::IBalanceOracle> balanceOracle,
        std::shared_ptr<ports::output::IPositionCensus> positionCensus,
        std::shared_ptr<DailyBaseline> baseline,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : balanceOracle_(std::move(balanceOracle))
      , positionCensus_(std::move(positionCensus))
      , baseline_(std::move(baseline))
      , clock_(std::move(clock))
      , gatewaySettings_(std::move(gatewaySettings))
      , metrics_(std::move(metrics))
    {}

    domain::GuardContext build(const std::string& instrument, std::optional<double> stopDistance) {
        domain::GuardContext ctx;
        ctx.instrument = instrument;
        ctx.stopDistance = stopDistance;
        ctx.killSwitchEngaged = !gatewaySettings_->isTradingEnabled();
        ctx.localTime = clock_->localNow();

        ctx.balance = balanceOracle_->currentBalance();
        if (ctx.balance.degraded) {
            std::cerr << "[GuardContextProvider] Balance degraded, using fallback "
                      << ctx.balance.amount << std::endl;
            metrics_->increment("upstream_degraded_total", {{"source", "balance"}});
        }

        ctx.positions = positionCensus_->openPositions();
        if (ctx.positions.degraded) {
            std::cerr << "[GuardContextProvider] Positions degraded, assuming none open" << std::endl;
            metrics_->increment("upstream_degraded_total", {{"source", "positions"}});
        }

        auto snapshot = baseline_->observe(ctx.balance, ctx.localTime);
        ctx.startOfDayBalance = snapshot.startOfDay;
        ctx.latestBalance = snapshot.latest;
        return ctx;
    }

private:
    std::shared_ptr<ports::output::IBalanceOracle> balanceOracle_;
    std::shared_ptr<ports::output::IPositionCensus> positionCensus_;
    std::shared_ptr<DailyBaseline> baseline_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace gateway::application

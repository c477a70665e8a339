#pragma once

#include "domain/Signal.hpp"
#include "domain/GuardContext.hpp"
#include "domain/GuardDecision.hpp"
#include "domain/RiskPolicy.hpp"
#include "domain/DailyLossInfo.hpp"
#include "domain/TradingWindow.hpp"
#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace gateway::application::guards {

using Guard = std::function<domain::GuardDecision(
    const domain::Signal&, const domain::GuardContext&, const domain::RiskPolicy&)>;

inline const std::string KILL_SWITCH = "kill_switch";
inline const std::string TRADING_WINDOW = "trading_window";
inline const std::string DAILY_LOSS = "daily_loss";
inline const std::string CONCURRENCY = "concurrency";
inline const std::string MIN_STOP = "min_stop";
inline const std::string ALLOW_LIST = "allow_list";

namespace detail {

inline std::string percent(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value << "%";
    return ss.str();
}

} // namespace detail

/**
 * @brief Пусто или некорректная спецификация — ограничения нет
 */
inline bool withinTradingWindow(const std::string& spec, const domain::LocalTime& local) {
    auto window = domain::TradingWindow::parse(spec);
    return !window || window->contains(local);
}

/**
 * @brief Просадка от первого баланса дня до последнего
 *
 * Выключено при пороге <= 0. Без записи за сегодня (или с нулевым
 * стартовым балансом) просадка считается нулевой.
 */
inline domain::DailyLossInfo evaluateDailyLoss(const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    domain::DailyLossInfo info;
    info.limitPct = policy.dailyLossStopPct;
    if (policy.dailyLossStopPct <= 0.0) {
        return info;
    }

    info.enabled = true;
    info.startBalance = ctx.startOfDayBalance;
    info.balanceNow = ctx.latestBalance ? ctx.latestBalance : std::optional<double>(ctx.balance.amount);

    if (!info.startBalance || *info.startBalance <= 0.0 || !info.balanceNow) {
        return info;
    }

    info.drawdownPct = std::max(0.0, (*info.startBalance - *info.balanceNow) / *info.startBalance * 100.0);
    info.ok = info.drawdownPct < policy.dailyLossStopPct;
    return info;
}

inline domain::GuardDecision killSwitchGuard(
    const domain::Signal&, const domain::GuardContext& ctx, const domain::RiskPolicy&) {
    if (ctx.killSwitchEngaged) {
        return domain::GuardDecision::veto(KILL_SWITCH, "TRADING_ENABLED=false");
    }
    return domain::GuardDecision::pass(KILL_SWITCH);
}

inline domain::GuardDecision tradingWindowGuard(
    const domain::Signal&, const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    if (!withinTradingWindow(policy.tradingWindow, ctx.localTime)) {
        return domain::GuardDecision::veto(TRADING_WINDOW, "outside trading window " + policy.tradingWindow);
    }
    return domain::GuardDecision::pass(TRADING_WINDOW);
}

inline domain::GuardDecision dailyLossGuard(
    const domain::Signal&, const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    auto info = evaluateDailyLoss(ctx, policy);
    if (!info.ok) {
        return domain::GuardDecision::veto(DAILY_LOSS,
            "daily loss stop hit: drawdown " + detail::percent(info.drawdownPct) +
            " >= " + detail::percent(info.limitPct));
    }
    return domain::GuardDecision::pass(DAILY_LOSS);
}

inline domain::GuardDecision concurrencyGuard(
    const domain::Signal&, const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    if (policy.maxOpenPositions > 0 && ctx.positions.total >= policy.maxOpenPositions) {
        return domain::GuardDecision::veto(CONCURRENCY,
            "max open positions reached (" + std::to_string(ctx.positions.total) +
            "/" + std::to_string(policy.maxOpenPositions) + ")");
    }

    int cap = policy.maxOpenPerInstrument;
    auto it = policy.instrumentMaxOpen.find(ctx.instrument);
    if (it != policy.instrumentMaxOpen.end()) {
        cap = it->second;
    }

    int open = ctx.positions.countFor(ctx.instrument);
    if (cap > 0 && open >= cap) {
        return domain::GuardDecision::veto(CONCURRENCY,
            "max open positions for " + ctx.instrument + " reached (" +
            std::to_string(open) + "/" + std::to_string(cap) + ")");
    }
    return domain::GuardDecision::pass(CONCURRENCY);
}

inline domain::GuardDecision minStopGuard(
    const domain::Signal&, const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    auto it = policy.instrumentMinStop.find(ctx.instrument);
    if (it != policy.instrumentMinStop.end() && ctx.stopDistance && *ctx.stopDistance < it->second) {
        std::ostringstream reason;
        reason << "stop distance " << *ctx.stopDistance << " below minimum "
               << it->second << " for " << ctx.instrument;
        return domain::GuardDecision::veto(MIN_STOP, reason.str());
    }
    return domain::GuardDecision::pass(MIN_STOP);
}

inline domain::GuardDecision allowListGuard(
    const domain::Signal& signal, const domain::GuardContext& ctx, const domain::RiskPolicy& policy) {
    const auto& allowed = policy.allowList;
    if (std::find(allowed.begin(), allowed.end(), ctx.instrument) == allowed.end()) {
        return domain::GuardDecision::veto(ALLOW_LIST, "Symbol " + signal.rawSymbol + " not allowed");
    }
    return domain::GuardDecision::pass(ALLOW_LIST);
}

/**
 * @brief Упорядоченная цепочка guard'ов
 *
 * Останавливается на первом вето. Порядок по умолчанию:
 * kill switch → trading window → daily loss → concurrency → min stop → allow-list.
 */
class GuardChain {
public:
    GuardChain()
        : guards_{killSwitchGuard, tradingWindowGuard, dailyLossGuard,
                  concurrencyGuard, minStopGuard, allowListGuard}
    {}

    explicit GuardChain(std::vector<Guard> guards) : guards_(std::move(guards)) {}

    domain::GuardVerdict evaluate(
        const domain::Signal& signal,
        const domain::GuardContext& ctx,
        const domain::RiskPolicy& policy
    ) const {
        domain::GuardVerdict verdict;
        for (const auto& guard : guards_) {
            auto decision = guard(signal, ctx, policy);
            verdict.decisions.push_back(decision);
            if (!decision.passed) {
                verdict.admitted = false;
                break;
            }
        }
        return verdict;
    }

private:
    std::vector<Guard> guards_;
};

} // namespace gateway::application::guards

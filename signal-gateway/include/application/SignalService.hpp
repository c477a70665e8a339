#pragma once

#include "ports/input/ISignalService.hpp"
#include "ports/output/IClock.hpp"
#include "application/SymbolResolver.hpp"
#include "application/UnitConverter.hpp"
#include "application/IdempotencyFilter.hpp"
#include "application/GuardContextProvider.hpp"
#include "application/RiskSizer.hpp"
#include "application/DualExecutionRouter.hpp"
#include "application/SignalReporter.hpp"
#include "application/guards/AdmissionGuards.hpp"
#include "settings/IRiskSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <iostream>

namespace gateway::application {

/**
 * @brief Обработка торгового сигнала от приёма до исполнения
 *
 * Received → Deduplicated (ignored)
 *          → Guarded (rejected / skipped)
 *          → Resolved → Sized → Routed → ok / partial / error
 *
 * На любом пути выхода — ровно одна запись аудита и одно уведомление.
 */
class SignalService : public ports::input::ISignalService {
public:
    SignalService(
        std::shared_ptr<SymbolResolver> resolver,
        std::shared_ptr<IdempotencyFilter> idempotency,
        std::shared_ptr<GuardContextProvider> contextProvider,
        std::shared_ptr<RiskSizer> sizer,
        std::shared_ptr<DualExecutionRouter> router,
        std::shared_ptr<SignalReporter> reporter,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::IRiskSettings> riskSettings
    ) : resolver_(std::move(resolver))
      , converter_(resolver_)
      , idempotency_(std::move(idempotency))
      , contextProvider_(std::move(contextProvider))
      , sizer_(std::move(sizer))
      , router_(std::move(router))
      , reporter_(std::move(reporter))
      , clock_(std::move(clock))
      , policy_(resolver_->canonicalize(riskSettings->getPolicy()))
    {
        std::cout << "[SignalService] Created, allow-list: " << policy_.allowList.size()
                  << " instruments" << std::endl;
    }

    domain::AuditRecord process(const domain::Signal& signal) override {
        domain::AuditRecord record;
        record.time = clock_->now();
        record.orderId = signal.orderId.empty()
            ? utils::UuidGenerator::generateWithPrefix("tv")
            : signal.orderId;
        record.rawSymbol = signal.rawSymbol;
        record.side = signal.side;
        record.price = signal.price;
        record.requestedRiskPct = signal.riskPct;

        try {
            handle(signal, record);
        } catch (const std::exception& e) {
            std::cerr << "[SignalService] " << record.orderId << " failed: " << e.what() << std::endl;
            record.status = domain::SignalStatus::ERROR;
            record.reason = e.what();
        }

        reporter_->report(record);
        return record;
    }

    domain::DryRunReport preview(const domain::Signal& signal) override {
        domain::DryRunReport report;
        report.rawSymbol = signal.rawSymbol;
        report.instrument = resolver_->resolve(signal.rawSymbol);
        report.side = signal.side.value_or(domain::Side::BUY);
        report.entry = signal.price.value_or(0.0);
        report.requestedRiskPct = signal.riskPct;

        const auto& allowed = policy_.allowList;
        report.allowed = std::find(allowed.begin(), allowed.end(), report.instrument) != allowed.end();
        if (!report.allowed) {
            return report;
        }

        auto stopDelta = delta(report.instrument, signal.stop);
        report.stopPrice = stopPrice(report.side, report.entry, stopDelta);
        report.targetPrice = targetPrice(report.side, report.entry, delta(report.instrument, signal.target));

        auto ctx = contextProvider_->build(report.instrument, stopDelta);
        auto sizing = sizer_->size(report.instrument, ctx.balance.amount, signal.riskPct,
                                   report.entry, report.stopPrice);
        report.units = sizing.units;
        report.appliedRiskPct = sizing.appliedRiskPct;
        report.tradingWindowOk = guards::withinTradingWindow(policy_.tradingWindow, ctx.localTime);
        report.dailyLoss = guards::evaluateDailyLoss(ctx, policy_);
        report.openPositionsTotal = ctx.positions.total;
        report.openPositionsForInstrument = ctx.positions.countFor(report.instrument);
        return report;
    }

private:
    std::shared_ptr<SymbolResolver> resolver_;
    UnitConverter converter_;
    std::shared_ptr<IdempotencyFilter> idempotency_;
    std::shared_ptr<GuardContextProvider> contextProvider_;
    std::shared_ptr<RiskSizer> sizer_;
    std::shared_ptr<DualExecutionRouter> router_;
    std::shared_ptr<SignalReporter> reporter_;
    std::shared_ptr<ports::output::IClock> clock_;
    domain::RiskPolicy policy_;
    guards::GuardChain guards_;

    void handle(const domain::Signal& signal, domain::AuditRecord& record) {
        if (!signal.side || signal.rawSymbol.empty()) {
            reject(record, "validation", "Missing side/symbol");
            return;
        }
        if (!signal.price) {
            reject(record, "validation", "Missing price");
            return;
        }
        if (!hasFiniteNumbers(signal)) {
            reject(record, "validation", "Non-finite price/sl/tp/risk_pct");
            return;
        }

        if (idempotency_->seen(record.orderId)) {
            record.status = domain::SignalStatus::IGNORED;
            record.reason = "duplicate order_id";
            return;
        }

        domain::Side side = *signal.side;
        double entry = *signal.price;
        record.instrument = resolver_->resolve(signal.rawSymbol);

        auto stopDelta = delta(record.instrument, signal.stop);
        auto ctx = contextProvider_->build(record.instrument, stopDelta);
        record.balance = ctx.balance.amount;
        record.balanceDegraded = ctx.balance.degraded;

        auto verdict = guards_.evaluate(signal, ctx, policy_);
        record.guardDecisions = verdict.decisions;
        if (const auto* veto = verdict.veto()) {
            record.status = veto->guard == guards::KILL_SWITCH
                ? domain::SignalStatus::SKIPPED
                : domain::SignalStatus::REJECTED;
            record.guard = veto->guard;
            record.reason = veto->reason;
            return;
        }

        record.stopPrice = stopPrice(side, entry, stopDelta);
        record.targetPrice = targetPrice(side, entry, delta(record.instrument, signal.target));

        auto sizing = sizer_->size(record.instrument, ctx.balance.amount, signal.riskPct,
                                   entry, record.stopPrice);
        record.units = sizing.units;
        record.appliedRiskPct = sizing.appliedRiskPct;

        domain::ExecutionRequest request;
        request.instrument = record.instrument;
        request.side = side;
        request.units = sizing.units;
        request.entryPrice = entry;
        request.stopPrice = record.stopPrice;
        request.targetPrice = record.targetPrice;

        auto report = router_->execute(request);
        record.outcomes = {report.broker, report.copyTrade};
        switch (report.status) {
            case domain::AggregateStatus::OK:
                record.status = domain::SignalStatus::OK;
                break;
            case domain::AggregateStatus::PARTIAL:
                record.status = domain::SignalStatus::PARTIAL;
                break;
            case domain::AggregateStatus::ERROR:
                record.status = domain::SignalStatus::ERROR;
                record.reason = "all execution targets failed";
                break;
        }
    }

    static bool hasFiniteNumbers(const domain::Signal& signal) {
        return std::isfinite(*signal.price)
            && std::isfinite(signal.riskPct)
            && (!signal.stop || std::isfinite(signal.stop->value))
            && (!signal.target || std::isfinite(signal.target->value));
    }

    static void reject(domain::AuditRecord& record, const std::string& guard, const std::string& reason) {
        record.status = domain::SignalStatus::REJECTED;
        record.guard = guard;
        record.reason = reason;
    }

    std::optional<double> delta(const std::string& instrument, const std::optional<domain::Distance>& distance) const {
        if (!distance) {
            return std::nullopt;
        }
        return converter_.toPriceDelta(instrument, distance->value, distance->unit);
    }

    static std::optional<double> stopPrice(domain::Side side, double entry, std::optional<double> delta) {
        if (!delta) return std::nullopt;
        return side == domain::Side::BUY ? entry - *delta : entry + *delta;
    }

    static std::optional<double> targetPrice(domain::Side side, double entry, std::optional<double> delta) {
        if (!delta) return std::nullopt;
        return side == domain::Side::BUY ? entry + *delta : entry - *delta;
    }
};

} // namespace gateway::application

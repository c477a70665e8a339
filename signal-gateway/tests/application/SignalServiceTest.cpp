/**
 * @file SignalServiceTest.cpp
 * @brief Unit-тесты для SignalService
 *
 * Полный путь сигнала: дедупликация → guard'ы → сайзинг → роутинг → аудит.
 * Внешние системы заменены mock'ами, прикладные компоненты настоящие.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/SignalService.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/MockApplication.hpp"
#include "../mocks/MockBrokerGateway.hpp"
#include "../mocks/MockCopyTradeRelay.hpp"
#include "../mocks/MockMarketData.hpp"
#include "../mocks/MockSettings.hpp"
#include "../mocks/MockSinks.hpp"

#include <cmath>
#include <limits>

using namespace gateway;
using namespace gateway::application;
using ::testing::_;
using ::testing::NiceMock;

// ============================================================================
// Test Fixture
// ============================================================================

class SignalServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<tests::FakeClock>();
        riskSettings_ = std::make_shared<tests::MockRiskSettings>();
        gatewaySettings_ = std::make_shared<tests::MockGatewaySettings>();
        copyTradeSettings_ = std::make_shared<tests::MockCopyTradeSettings>();
        balanceOracle_ = std::make_shared<tests::MockBalanceOracle>();
        positions_ = std::make_shared<tests::MockPositionCensus>();
        equity_ = std::make_shared<tests::MockEquitySeries>();
        broker_ = std::make_shared<tests::MockBrokerGateway>();
        relay_ = std::make_shared<tests::MockCopyTradeRelay>();
        auditLog_ = std::make_shared<tests::MockAuditLog>();
        notifier_ = std::make_shared<tests::MockNotifier>();
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());
    }

    // Политика читается в конструкторе, поэтому сервис собирается после настройки
    std::shared_ptr<SignalService> makeService() {
        auto resolver = std::make_shared<SymbolResolver>(tests::builtInCatalog());
        auto idempotency = std::make_shared<IdempotencyFilter>(
            clock_, std::make_shared<settings::CacheSettings>(15, 5, 90));
        auto baseline = std::make_shared<DailyBaseline>(equity_, clock_);
        auto provider = std::make_shared<GuardContextProvider>(
            balanceOracle_, positions_, baseline, clock_, gatewaySettings_, metrics_);
        sizer_ = std::make_shared<NiceMock<tests::MockRiskSizer>>(riskSettings_, resolver);
        router_ = std::make_shared<NiceMock<tests::MockDualExecutionRouter>>(
            broker_, relay_, gatewaySettings_, copyTradeSettings_);
        auto reporter = std::make_shared<SignalReporter>(auditLog_, notifier_, metrics_);
        return std::make_shared<SignalService>(
            resolver, idempotency, provider, sizer_, router_, reporter, clock_, riskSettings_);
    }

    domain::Signal makeSignal(const std::string& symbol = "US30") {
        domain::Signal s;
        s.side = domain::Side::BUY;
        s.rawSymbol = symbol;
        s.price = 39250.0;
        s.stop = domain::Distance{150.0, domain::UnitKind::POINTS};
        s.target = domain::Distance{300.0, domain::UnitKind::POINTS};
        s.riskPct = 0.05;
        return s;
    }

    std::shared_ptr<tests::FakeClock> clock_;
    std::shared_ptr<tests::MockRiskSettings> riskSettings_;
    std::shared_ptr<tests::MockGatewaySettings> gatewaySettings_;
    std::shared_ptr<tests::MockCopyTradeSettings> copyTradeSettings_;
    std::shared_ptr<tests::MockBalanceOracle> balanceOracle_;
    std::shared_ptr<tests::MockPositionCensus> positions_;
    std::shared_ptr<tests::MockEquitySeries> equity_;
    std::shared_ptr<tests::MockBrokerGateway> broker_;
    std::shared_ptr<tests::MockCopyTradeRelay> relay_;
    std::shared_ptr<tests::MockAuditLog> auditLog_;
    std::shared_ptr<tests::MockNotifier> notifier_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<NiceMock<tests::MockRiskSizer>> sizer_;
    std::shared_ptr<NiceMock<tests::MockDualExecutionRouter>> router_;
};

// ============================================================================
// ТЕСТЫ: успешный путь
// ============================================================================

TEST_F(SignalServiceTest, DryRun_SizesAndReportsNoops) {
    auto service = makeService();

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::OK);
    EXPECT_EQ(record.instrument, "US30_USD");
    EXPECT_EQ(record.units, 3);
    EXPECT_EQ(record.stopPrice, 39100.0);
    EXPECT_EQ(record.targetPrice, 39550.0);
    ASSERT_EQ(record.outcomes.size(), 2u);
    EXPECT_TRUE(record.outcomes[0].skipped);
    EXPECT_TRUE(record.outcomes[1].skipped);
    EXPECT_EQ(broker_->orderCallCount(), 0);
    EXPECT_EQ(relay_->forwardCallCount(), 0);
}

TEST_F(SignalServiceTest, Live_SellOrderForwardedToBothTargets) {
    gatewaySettings_->dryRun = false;
    auto service = makeService();
    auto signal = makeSignal();
    signal.side = domain::Side::SELL;

    auto record = service->process(signal);

    EXPECT_EQ(record.status, domain::SignalStatus::OK);
    EXPECT_EQ(record.stopPrice, 39400.0);
    EXPECT_EQ(record.targetPrice, 38950.0);
    EXPECT_EQ(broker_->lastUnits(), -3);
    ASSERT_EQ(relay_->forwardCallCount(), 1);
    EXPECT_EQ(relay_->getOrders()[0].stopPrice, 39400.0);
}

TEST_F(SignalServiceTest, Live_BrokerFails_Partial) {
    gatewaySettings_->dryRun = false;
    broker_->setOrderOutcome(domain::TargetOutcome::failure("broker", 400, "MARKET_HALTED"));
    auto service = makeService();

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::PARTIAL);
    EXPECT_EQ(notifier_->getNotifications().back().color, SignalReporter::COLOR_PARTIAL);
}

TEST_F(SignalServiceTest, Live_AllTargetsFail_Error) {
    gatewaySettings_->dryRun = false;
    broker_->setOrderOutcome(domain::TargetOutcome::failure("broker", 502, "down"));
    relay_->setOutcome(domain::TargetOutcome::failure("copy_trade", 504, "timeout"));
    auto service = makeService();

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::ERROR);
    EXPECT_EQ(record.reason, "all execution targets failed");
    EXPECT_EQ(notifier_->getNotifications().back().title, "Execution Error");
}

TEST_F(SignalServiceTest, NoStop_OneUnit) {
    auto service = makeService();
    auto signal = makeSignal();
    signal.stop.reset();

    auto record = service->process(signal);

    EXPECT_EQ(record.units, 1);
    EXPECT_FALSE(record.stopPrice.has_value());
}

// ============================================================================
// ТЕСТЫ: guard'ы
// ============================================================================

TEST_F(SignalServiceTest, DailyLossHit_RejectedBeforeRouting) {
    riskSettings_->policy.dailyLossStopPct = 1.5;
    equity_->append(domain::EquitySample{clock_->now(), "2024-03-13", 10000.0});
    balanceOracle_->setBalance(9800.0);
    auto service = makeService();

    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
    EXPECT_EQ(record.guard, "daily_loss");
    EXPECT_EQ(notifier_->getNotifications().back().title, "Blocked by Daily Loss Stop");
}

TEST_F(SignalServiceTest, PerInstrumentCapReached_Rejected) {
    riskSettings_->policy.maxOpenPerInstrument = 2;
    positions_->setOpen("US30_USD", 2);
    auto service = makeService();

    EXPECT_CALL(*sizer_, size(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
    EXPECT_EQ(record.guard, "concurrency");
}

TEST_F(SignalServiceTest, SymbolNotAllowed_ShortCircuits) {
    auto service = makeService();

    EXPECT_CALL(*sizer_, size(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto record = service->process(makeSignal("BTCUSD"));

    EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
    EXPECT_EQ(record.reason, "Symbol BTCUSD not allowed");
}

TEST_F(SignalServiceTest, KillSwitch_Skipped) {
    gatewaySettings_->tradingEnabled = false;
    auto service = makeService();

    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::SKIPPED);
    EXPECT_EQ(record.reason, "TRADING_ENABLED=false");
    EXPECT_EQ(notifier_->getNotifications().back().title, "Trading Disabled");
}

TEST_F(SignalServiceTest, OutsideWindow_Rejected) {
    riskSettings_->policy.tradingWindow = "MON-FRI 12:00-16:00";
    auto service = makeService();

    auto record = service->process(makeSignal());

    EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
    EXPECT_EQ(record.guard, "trading_window");
    EXPECT_EQ(notifier_->getNotifications().back().color, SignalReporter::COLOR_WINDOW);
}

// ============================================================================
// ТЕСТЫ: валидация и дедупликация
// ============================================================================

TEST_F(SignalServiceTest, MissingSide_ValidationReject) {
    auto service = makeService();
    auto signal = makeSignal();
    signal.side.reset();

    auto record = service->process(signal);

    EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
    EXPECT_EQ(record.guard, "validation");
    EXPECT_EQ(record.reason, "Missing side/symbol");
    EXPECT_EQ(balanceOracle_->callCount(), 0);
}

TEST_F(SignalServiceTest, MissingPrice_ValidationReject) {
    auto service = makeService();
    auto signal = makeSignal();
    signal.price.reset();

    auto record = service->process(signal);

    EXPECT_EQ(record.reason, "Missing price");
}

TEST_F(SignalServiceTest, NonFiniteNumbers_ValidationReject) {
    auto service = makeService();
    EXPECT_CALL(*sizer_, size(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto nanPrice = makeSignal();
    nanPrice.price = std::nan("");
    auto infStop = makeSignal();
    infStop.stop = domain::Distance{std::numeric_limits<double>::infinity(), domain::UnitKind::POINTS};
    auto nanTarget = makeSignal();
    nanTarget.target = domain::Distance{std::nan(""), domain::UnitKind::PIPS};
    auto nanRisk = makeSignal();
    nanRisk.riskPct = std::nan("");

    for (const auto& signal : {nanPrice, infStop, nanTarget, nanRisk}) {
        auto record = service->process(signal);
        EXPECT_EQ(record.status, domain::SignalStatus::REJECTED);
        EXPECT_EQ(record.guard, "validation");
    }
    EXPECT_EQ(balanceOracle_->callCount(), 0);
    EXPECT_EQ(auditLog_->appendCallCount(), 4u);
}

TEST_F(SignalServiceTest, DuplicateOrderId_SecondIgnored) {
    gatewaySettings_->dryRun = false;
    auto service = makeService();
    auto signal = makeSignal();
    signal.orderId = "tv-123";

    auto first = service->process(signal);
    auto second = service->process(signal);

    EXPECT_EQ(first.status, domain::SignalStatus::OK);
    EXPECT_EQ(second.status, domain::SignalStatus::IGNORED);
    EXPECT_EQ(second.reason, "duplicate order_id");
    EXPECT_EQ(broker_->orderCallCount(), 1);
    EXPECT_EQ(auditLog_->appendCallCount(), 2u);
}

TEST_F(SignalServiceTest, MissingOrderId_Generated) {
    auto service = makeService();

    auto first = service->process(makeSignal());
    auto second = service->process(makeSignal());

    EXPECT_EQ(first.orderId.rfind("tv-", 0), 0u);
    EXPECT_NE(first.orderId, second.orderId);
    EXPECT_EQ(second.status, domain::SignalStatus::OK);
}

// ============================================================================
// ТЕСТЫ: аудит, уведомления, метрики
// ============================================================================

TEST_F(SignalServiceTest, EveryOutcome_ExactlyOneAuditAndNotification) {
    auto service = makeService();
    auto bad = makeSignal();
    bad.price.reset();

    service->process(makeSignal());
    service->process(bad);
    service->process(makeSignal("BTCUSD"));

    EXPECT_EQ(auditLog_->appendCallCount(), 3u);
    EXPECT_EQ(notifier_->getNotifications().size(), 3u);
    EXPECT_EQ(metrics_->get("signals_total", {{"status", "ok"}}), 1);
    EXPECT_EQ(metrics_->get("signals_total", {{"status", "rejected"}}), 2);
}

TEST_F(SignalServiceTest, DegradedBalance_UsesFallbackAndCounts) {
    balanceOracle_->setBalance(1000000.0, true);
    auto service = makeService();

    auto record = service->process(makeSignal());

    EXPECT_TRUE(record.balanceDegraded);
    EXPECT_EQ(record.units, 3);
    EXPECT_EQ(metrics_->get("upstream_degraded_total", {{"source", "balance"}}), 1);
}

// ============================================================================
// ТЕСТЫ: preview
// ============================================================================

TEST_F(SignalServiceTest, Preview_ComputesWithoutSideEffects) {
    auto service = makeService();
    EXPECT_CALL(*router_, execute(_)).Times(0);

    auto report = service->preview(makeSignal());

    EXPECT_TRUE(report.allowed);
    EXPECT_EQ(report.instrument, "US30_USD");
    EXPECT_EQ(report.units, 3);
    EXPECT_EQ(report.stopPrice, 39100.0);
    EXPECT_TRUE(report.tradingWindowOk);
    EXPECT_EQ(auditLog_->appendCallCount(), 0u);
    EXPECT_TRUE(notifier_->getNotifications().empty());
}

TEST_F(SignalServiceTest, Preview_NotAllowed_NoLookups) {
    auto service = makeService();

    auto report = service->preview(makeSignal("BTCUSD"));

    EXPECT_FALSE(report.allowed);
    EXPECT_EQ(balanceOracle_->callCount(), 0);
}

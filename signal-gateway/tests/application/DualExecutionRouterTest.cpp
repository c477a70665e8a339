/**
 * @file DualExecutionRouterTest.cpp
 * @brief Unit-тесты для DualExecutionRouter
 */

#include <gtest/gtest.h>

#include "application/DualExecutionRouter.hpp"
#include "../mocks/MockBrokerGateway.hpp"
#include "../mocks/MockCopyTradeRelay.hpp"
#include "../mocks/MockSettings.hpp"

using namespace gateway;
using namespace gateway::application;

class DualExecutionRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<tests::MockBrokerGateway>();
        relay_ = std::make_shared<tests::MockCopyTradeRelay>();
        gatewaySettings_ = std::make_shared<tests::MockGatewaySettings>();
        gatewaySettings_->dryRun = false;
        copyTradeSettings_ = std::make_shared<tests::MockCopyTradeSettings>();
        router_ = std::make_shared<DualExecutionRouter>(broker_, relay_, gatewaySettings_, copyTradeSettings_);

        request_.instrument = "US30_USD";
        request_.side = domain::Side::SELL;
        request_.units = 3;
        request_.entryPrice = 42000.0;
        request_.stopPrice = 42050.0;
    }

    std::shared_ptr<tests::MockBrokerGateway> broker_;
    std::shared_ptr<tests::MockCopyTradeRelay> relay_;
    std::shared_ptr<tests::MockGatewaySettings> gatewaySettings_;
    std::shared_ptr<tests::MockCopyTradeSettings> copyTradeSettings_;
    std::shared_ptr<DualExecutionRouter> router_;
    domain::ExecutionRequest request_;
};

// ============================================================================
// ТЕСТЫ: агрегирование
// ============================================================================

TEST_F(DualExecutionRouterTest, BothSucceed_Ok) {
    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::OK);
    EXPECT_EQ(broker_->orderCallCount(), 1);
    EXPECT_EQ(broker_->lastUnits(), -3);
    EXPECT_EQ(relay_->forwardCallCount(), 1);
    EXPECT_EQ(report.broker.target, "broker");
    EXPECT_EQ(report.copyTrade.target, "copy_trade");
}

TEST_F(DualExecutionRouterTest, BrokerFails_Partial) {
    broker_->setOrderOutcome(domain::TargetOutcome::failure("broker", 400, "INSUFFICIENT_MARGIN"));

    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::PARTIAL);
    EXPECT_FALSE(report.broker.success);
    EXPECT_TRUE(report.copyTrade.success);
}

TEST_F(DualExecutionRouterTest, BothFail_Error) {
    broker_->setOrderOutcome(domain::TargetOutcome::failure("broker", 502, "bad gateway"));
    relay_->setOutcome(domain::TargetOutcome::failure("copy_trade", 504, "timeout"));

    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::ERROR);
    EXPECT_EQ(report.copyTrade.statusCode, 504);
}

TEST_F(DualExecutionRouterTest, BrokerThrows_RelayStillCalled) {
    broker_->setThrowOnOrder(true);

    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::PARTIAL);
    EXPECT_EQ(report.broker.statusCode, 500);
    EXPECT_EQ(report.broker.message, "connection reset");
    EXPECT_EQ(relay_->forwardCallCount(), 1);
}

TEST_F(DualExecutionRouterTest, RelayThrows_CapturedAsFailure) {
    relay_->setThrow(true);

    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::PARTIAL);
    EXPECT_FALSE(report.copyTrade.success);
    EXPECT_EQ(report.copyTrade.message, "relay down");
}

// ============================================================================
// ТЕСТЫ: dry run и форвардинг
// ============================================================================

TEST_F(DualExecutionRouterTest, DryRun_NoTargetCalled_Ok) {
    gatewaySettings_->dryRun = true;

    auto report = router_->execute(request_);

    EXPECT_EQ(report.status, domain::AggregateStatus::OK);
    EXPECT_EQ(broker_->orderCallCount(), 0);
    EXPECT_EQ(relay_->forwardCallCount(), 0);
    EXPECT_TRUE(report.broker.skipped);
    EXPECT_TRUE(report.copyTrade.skipped);
}

TEST_F(DualExecutionRouterTest, CopyTradeForwardingDisabled_OnlyBroker) {
    gatewaySettings_->forwardToCopyTrade = false;

    auto report = router_->execute(request_);

    EXPECT_EQ(broker_->orderCallCount(), 1);
    EXPECT_EQ(relay_->forwardCallCount(), 0);
    EXPECT_EQ(report.status, domain::AggregateStatus::OK);
}

TEST_F(DualExecutionRouterTest, CopyTradeOrder_CarriesRequest) {
    router_->execute(request_);

    auto orders = relay_->getOrders();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].source, "OANDA_MASTER");
    EXPECT_EQ(orders[0].instrument, "US30_USD");
    EXPECT_EQ(orders[0].side, domain::Side::SELL);
    EXPECT_EQ(orders[0].units, 3);
    EXPECT_EQ(orders[0].stopPrice, 42050.0);
    EXPECT_EQ(orders[0].clientOrderId.rfind("tv_v1-", 0), 0u);
}

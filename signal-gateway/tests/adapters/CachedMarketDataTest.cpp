/**
 * @file CachedMarketDataTest.cpp
 * @brief Unit-тесты для CachedBalanceOracle и CachedPositionCensus
 */

#include <gtest/gtest.h>

#include "adapters/secondary/CachedBalanceOracle.hpp"
#include "adapters/secondary/CachedPositionCensus.hpp"
#include "../mocks/MockBrokerGateway.hpp"
#include "../mocks/MockSettings.hpp"

#include <chrono>
#include <future>
#include <limits>
#include <map>
#include <vector>

using namespace gateway;
using namespace gateway::adapters::secondary;

class CachedMarketDataTest : public ::testing::Test {
protected:
    void SetUp() override {
        broker_ = std::make_shared<tests::MockBrokerGateway>();
        riskSettings_ = std::make_shared<tests::MockRiskSettings>();
        riskSettings_->policy.fallbackBalance = 50000.0;
        cacheSettings_ = std::make_shared<settings::CacheSettings>(15, 5, 90);
    }

    std::shared_ptr<tests::MockBrokerGateway> broker_;
    std::shared_ptr<tests::MockRiskSettings> riskSettings_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
};

// ============================================================================
// ТЕСТЫ: CachedBalanceOracle
// ============================================================================

TEST_F(CachedMarketDataTest, Balance_CachedWithinTtl) {
    broker_->setBalance(123456.0);
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    auto first = oracle.currentBalance();
    auto second = oracle.currentBalance();

    EXPECT_DOUBLE_EQ(first.amount, 123456.0);
    EXPECT_FALSE(first.degraded);
    EXPECT_DOUBLE_EQ(second.amount, 123456.0);
    EXPECT_EQ(broker_->balanceCallCount(), 1);
}

TEST_F(CachedMarketDataTest, Balance_Unavailable_FallbackDegraded) {
    broker_->setBalance(std::nullopt);
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    auto reading = oracle.currentBalance();

    EXPECT_DOUBLE_EQ(reading.amount, 50000.0);
    EXPECT_TRUE(reading.degraded);
}

TEST_F(CachedMarketDataTest, Balance_NonPositive_FallbackDegraded) {
    broker_->setBalance(0.0);
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    EXPECT_TRUE(oracle.currentBalance().degraded);
}

TEST_F(CachedMarketDataTest, Balance_FallbackNotCached) {
    broker_->setThrowOnRead(true);
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    EXPECT_TRUE(oracle.currentBalance().degraded);

    broker_->setThrowOnRead(false);
    broker_->setBalance(80000.0);
    auto reading = oracle.currentBalance();

    EXPECT_FALSE(reading.degraded);
    EXPECT_DOUBLE_EQ(reading.amount, 80000.0);
    EXPECT_EQ(broker_->balanceCallCount(), 2);
}

// ============================================================================
// ТЕСТЫ: CachedPositionCensus
// ============================================================================

TEST_F(CachedMarketDataTest, Positions_TotalsAndPerInstrument) {
    broker_->setOpenTrades(std::map<std::string, int>{{"US30_USD", 2}, {"EUR_USD", 1}});
    CachedPositionCensus census(broker_, cacheSettings_);

    auto snapshot = census.openPositions();

    EXPECT_EQ(snapshot.total, 3);
    EXPECT_EQ(snapshot.countFor("US30_USD"), 2);
    EXPECT_EQ(snapshot.countFor("XAU_USD"), 0);
    EXPECT_FALSE(snapshot.degraded);
}

TEST_F(CachedMarketDataTest, Positions_CachedWithinTtl) {
    CachedPositionCensus census(broker_, cacheSettings_);

    census.openPositions();
    census.openPositions();

    EXPECT_EQ(broker_->openTradesCallCount(), 1);
}

TEST_F(CachedMarketDataTest, Positions_Failure_ZeroDegraded) {
    broker_->setOpenTrades(std::nullopt);
    CachedPositionCensus census(broker_, cacheSettings_);

    auto snapshot = census.openPositions();
    census.openPositions();

    EXPECT_TRUE(snapshot.degraded);
    EXPECT_EQ(snapshot.total, 0);
    EXPECT_EQ(broker_->openTradesCallCount(), 2);
}

// ============================================================================
// ТЕСТЫ: одновременные промахи кэша
// ============================================================================

TEST_F(CachedMarketDataTest, Balance_ConcurrentMisses_OneUpstreamCall) {
    broker_->setBalance(123456.0);
    broker_->setReadDelay(std::chrono::milliseconds(200));
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    std::vector<std::future<domain::BalanceReading>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&oracle]() { return oracle.currentBalance(); }));
    }
    for (auto& f : futures) {
        auto reading = f.get();
        EXPECT_DOUBLE_EQ(reading.amount, 123456.0);
        EXPECT_FALSE(reading.degraded);
    }

    EXPECT_EQ(broker_->balanceCallCount(), 1);
}

TEST_F(CachedMarketDataTest, Balance_ConcurrentMissesDuringOutage_ShareFallback) {
    broker_->setBalance(std::nullopt);
    broker_->setReadDelay(std::chrono::milliseconds(200));
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    std::vector<std::future<domain::BalanceReading>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&oracle]() { return oracle.currentBalance(); }));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get().degraded);
    }

    // Fallback не кэшируется, но одновременные запросы не размножают вызовы
    EXPECT_LT(broker_->balanceCallCount(), 8);
}

TEST_F(CachedMarketDataTest, Positions_ConcurrentMisses_OneUpstreamCall) {
    broker_->setOpenTrades(std::map<std::string, int>{{"US30_USD", 2}});
    broker_->setReadDelay(std::chrono::milliseconds(200));
    CachedPositionCensus census(broker_, cacheSettings_);

    std::vector<std::future<domain::PositionSnapshot>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&census]() { return census.openPositions(); }));
    }
    for (auto& f : futures) {
        EXPECT_EQ(f.get().total, 2);
    }

    EXPECT_EQ(broker_->openTradesCallCount(), 1);
}

TEST_F(CachedMarketDataTest, Balance_NonFinite_FallbackDegraded) {
    broker_->setBalance(std::numeric_limits<double>::infinity());
    CachedBalanceOracle oracle(broker_, cacheSettings_, riskSettings_);

    auto reading = oracle.currentBalance();

    EXPECT_DOUBLE_EQ(reading.amount, 50000.0);
    EXPECT_TRUE(reading.degraded);
}

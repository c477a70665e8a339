#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/OandaBrokerGateway.hpp"
#include "../mocks/MockHttpClient.hpp"
#include "../mocks/MockSettings.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

using namespace gateway;
using namespace gateway::adapters::secondary;
using ::testing::_;

// ============================================================================
// Test Fixture
// ============================================================================

class OandaBrokerGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<tests::MockHttpClient>();
        settings_ = std::make_shared<tests::MockBrokerClientSettings>();
        gateway_ = std::make_shared<OandaBrokerGateway>(mockHttpClient_, settings_);
    }

    void expectRequest(const std::string& method, const std::string& expectedPath,
                       int status, const std::string& body) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([method, expectedPath, status, body](const IRequest& req, IResponse& res) {
                EXPECT_EQ(req.getMethod(), method);
                EXPECT_EQ(req.getPath(), expectedPath);

                auto headers = req.getHeaders();
                EXPECT_EQ(headers["Authorization"], "Bearer oanda-token-123456");

                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                return true;
            });
    }

    const std::string accountPath_ = "/v3/accounts/101-004-1234567-001";

    std::shared_ptr<tests::MockHttpClient> mockHttpClient_;
    std::shared_ptr<tests::MockBrokerClientSettings> settings_;
    std::shared_ptr<OandaBrokerGateway> gateway_;
};

// ============================================================================
// ТЕСТЫ: getAccountBalance
// ============================================================================

TEST_F(OandaBrokerGatewayTest, Balance_NavAsString_Parsed) {
    expectRequest("GET", accountPath_ + "/summary", 200,
                  R"({"account":{"NAV":"100523.4500","balance":"100000.0000"}})");

    auto balance = gateway_->getAccountBalance();

    ASSERT_TRUE(balance.has_value());
    EXPECT_DOUBLE_EQ(*balance, 100523.45);
}

TEST_F(OandaBrokerGatewayTest, Balance_NoNav_FallsBackToBalance) {
    expectRequest("GET", accountPath_ + "/summary", 200, R"({"account":{"balance":25000.5}})");

    EXPECT_EQ(gateway_->getAccountBalance(), 25000.5);
}

TEST_F(OandaBrokerGatewayTest, Balance_HttpError_Nullopt) {
    expectRequest("GET", accountPath_ + "/summary", 401, R"({"errorMessage":"Insufficient authorization"})");

    EXPECT_FALSE(gateway_->getAccountBalance().has_value());
}

TEST_F(OandaBrokerGatewayTest, Balance_MalformedBody_Nullopt) {
    expectRequest("GET", accountPath_ + "/summary", 200, "not json");

    EXPECT_FALSE(gateway_->getAccountBalance().has_value());
}

TEST_F(OandaBrokerGatewayTest, Balance_SendFails_Nullopt) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(::testing::Return(false));

    EXPECT_FALSE(gateway_->getAccountBalance().has_value());
}

TEST_F(OandaBrokerGatewayTest, NoCredentials_NoRequests) {
    settings_->token.clear();
    EXPECT_CALL(*mockHttpClient_, send(_, _)).Times(0);

    EXPECT_FALSE(gateway_->getAccountBalance().has_value());
    EXPECT_FALSE(gateway_->getOpenTrades().has_value());

    auto outcome = gateway_->placeMarketOrder("US30_USD", domain::Side::BUY, 3);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.statusCode, 401);
}

// ============================================================================
// ТЕСТЫ: getOpenTrades
// ============================================================================

TEST_F(OandaBrokerGatewayTest, OpenTrades_CountedPerInstrument) {
    expectRequest("GET", accountPath_ + "/openTrades", 200, R"({
        "trades": [
            {"id":"1","instrument":"US30_USD","currentUnits":"3"},
            {"id":"2","instrument":"US30_USD","currentUnits":"-2"},
            {"id":"3","instrument":"EUR_USD","currentUnits":"1000"}
        ]
    })");

    auto trades = gateway_->getOpenTrades();

    ASSERT_TRUE(trades.has_value());
    EXPECT_EQ(trades->at("US30_USD"), 2);
    EXPECT_EQ(trades->at("EUR_USD"), 1);
}

TEST_F(OandaBrokerGatewayTest, OpenTrades_Empty) {
    expectRequest("GET", accountPath_ + "/openTrades", 200, R"({"trades":[]})");

    auto trades = gateway_->getOpenTrades();
    ASSERT_TRUE(trades.has_value());
    EXPECT_TRUE(trades->empty());
}

// ============================================================================
// ТЕСТЫ: placeMarketOrder
// ============================================================================

TEST_F(OandaBrokerGatewayTest, Order_SellSendsNegativeUnits) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([this](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), accountPath_ + "/orders");

            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_EQ(body["order"]["instrument"], "US30_USD");
            EXPECT_EQ(body["order"]["units"], "-3");
            EXPECT_EQ(body["order"]["type"], "MARKET");

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(201);
            simpleRes.setBody(R"({"orderCreateTransaction":{"id":"6368"},"orderFillTransaction":{"id":"6369"}})");
            return true;
        });

    auto outcome = gateway_->placeMarketOrder("US30_USD", domain::Side::SELL, 3);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.statusCode, 201);
    EXPECT_EQ(outcome.message, "OANDA order placed #6369");
}

TEST_F(OandaBrokerGatewayTest, Order_Cancelled_IsFailure) {
    expectRequest("POST", accountPath_ + "/orders", 201,
                  R"({"orderCancelTransaction":{"reason":"MARKET_HALTED"}})");

    auto outcome = gateway_->placeMarketOrder("US30_USD", domain::Side::BUY, 3);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "OANDA order cancelled: MARKET_HALTED");
}

TEST_F(OandaBrokerGatewayTest, Order_Rejected_CarriesStatus) {
    expectRequest("POST", accountPath_ + "/orders", 400, R"({"errorMessage":"bad units"})");

    auto outcome = gateway_->placeMarketOrder("US30_USD", domain::Side::BUY, 3);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.statusCode, 400);
}

TEST_F(OandaBrokerGatewayTest, Order_SlowUpstream_TimesOut) {
    auto slowClient = std::make_shared<tests::RecordingHttpClient>();
    slowClient->setDelay(std::chrono::milliseconds(300));
    settings_->timeoutMs = 50;
    OandaBrokerGateway gateway(slowClient, settings_);

    auto outcome = gateway.placeMarketOrder("US30_USD", domain::Side::BUY, 3);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.statusCode, 504);
}

TEST_F(OandaBrokerGatewayTest, HungUpstream_InFlightCallsStayBounded) {
    auto hungClient = std::make_shared<tests::BlockingHttpClient>();
    hungClient->setBody(R"({"account":{"NAV":"100000.0"}})");
    settings_->timeoutMs = 10;
    OandaBrokerGateway gateway(hungClient, settings_);

    for (int i = 0; i < 3 * OandaBrokerGateway::MAX_IN_FLIGHT; ++i) {
        EXPECT_FALSE(gateway.getAccountBalance().has_value());
        EXPECT_LE(gateway.inFlightCalls(), OandaBrokerGateway::MAX_IN_FLIGHT);
    }

    // Сверх лимита запросы даже не доходят до клиента
    EXPECT_EQ(gateway.inFlightCalls(), OandaBrokerGateway::MAX_IN_FLIGHT);
    EXPECT_EQ(hungClient->callCount(), OandaBrokerGateway::MAX_IN_FLIGHT);

    auto order = gateway.placeMarketOrder("US30_USD", domain::Side::BUY, 3);
    EXPECT_FALSE(order.success);
    EXPECT_EQ(order.statusCode, 504);

    // Upstream ожил: брошенные потоки завершаются и освобождают слоты
    hungClient->release();
    for (int i = 0; i < 200 && gateway.inFlightCalls() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(gateway.inFlightCalls(), 0);

    settings_->timeoutMs = 1000;
    EXPECT_EQ(gateway.getAccountBalance(), 100000.0);
}

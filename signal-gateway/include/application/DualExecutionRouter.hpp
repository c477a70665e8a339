#pragma once

#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/ICopyTradeRelay.hpp"
#include "settings/IGatewaySettings.hpp"
#include "settings/ICopyTradeSettings.hpp"
#include "domain/ExecutionRequest.hpp"
#include "domain/ExecutionOutcome.hpp"
#include "domain/CopyTradeOrder.hpp"
#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <future>
#include <memory>
#include <iostream>

namespace gateway::application {

/**
 * @brief Отправка ордера на обе цели исполнения
 *
 * Broker и copy-trade вызываются независимо (broker в отдельной задаче),
 * сбой одной цели не влияет на другую. Повторов нет.
 * В dry-run или при выключенном форвардинге цель не вызывается
 * и засчитывается как успешная.
 */
class DualExecutionRouter {
public:
    static constexpr const char* BROKER = "broker";
    static constexpr const char* COPY_TRADE = "copy_trade";

    DualExecutionRouter(
        std::shared_ptr<ports::output::IBrokerGateway> broker,
        std::shared_ptr<ports::output::ICopyTradeRelay> copyTrade,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings,
        std::shared_ptr<settings::ICopyTradeSettings> copyTradeSettings
    ) : broker_(std::move(broker))
      , copyTrade_(std::move(copyTrade))
      , gatewaySettings_(std::move(gatewaySettings))
      , copyTradeSettings_(std::move(copyTradeSettings))
    {}

    virtual ~DualExecutionRouter() = default;

    virtual domain::ExecutionReport execute(const domain::ExecutionRequest& request) {
        bool dryRun = gatewaySettings_->isDryRun();
        bool sendToBroker = !dryRun && gatewaySettings_->isBrokerForwardingEnabled();
        bool sendToCopyTrade = !dryRun && gatewaySettings_->isCopyTradeForwardingEnabled();

        std::future<domain::TargetOutcome> brokerFuture;
        if (sendToBroker) {
            brokerFuture = std::async(std::launch::async, [this, request]() {
                return placeOnBroker(request);
            });
        }

        domain::ExecutionReport report;
        report.copyTrade = sendToCopyTrade
            ? forwardToCopyTrade(request)
            : domain::TargetOutcome::noop(COPY_TRADE, "copy-trade not called (dry run / forwarding disabled)");

        report.broker = sendToBroker
            ? brokerFuture.get()
            : domain::TargetOutcome::noop(BROKER, "broker not called (dry run / forwarding disabled)");

        report.status = domain::aggregate({report.broker, report.copyTrade});

        std::cout << "[DualExecutionRouter] " << request.instrument << " " << domain::toString(request.side)
                  << " x" << request.units << " -> " << domain::toString(report.status)
                  << " (broker " << report.broker.statusCode
                  << ", copy_trade " << report.copyTrade.statusCode << ")" << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::shared_ptr<ports::output::ICopyTradeRelay> copyTrade_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;
    std::shared_ptr<settings::ICopyTradeSettings> copyTradeSettings_;

    domain::TargetOutcome placeOnBroker(const domain::ExecutionRequest& request) {
        try {
            auto outcome = broker_->placeMarketOrder(request.instrument, request.side, request.units);
            outcome.target = BROKER;
            return outcome;
        } catch (const std::exception& e) {
            std::cerr << "[DualExecutionRouter] Broker error: " << e.what() << std::endl;
            return domain::TargetOutcome::failure(BROKER, 500, e.what());
        }
    }

    domain::TargetOutcome forwardToCopyTrade(const domain::ExecutionRequest& request) {
        try {
            domain::CopyTradeOrder order;
            order.source = copyTradeSettings_->getMasterSource();
            order.instrument = request.instrument;
            order.side = request.side;
            order.units = request.units;
            order.entryPrice = request.entryPrice;
            order.stopPrice = request.stopPrice;
            order.targetPrice = request.targetPrice;
            order.clientOrderId = utils::UuidGenerator::generateWithPrefix("tv_v1");
            order.comment = "TV->" + order.source + " " + domain::Timestamp::now().toString();

            auto outcome = copyTrade_->forward(order);
            outcome.target = COPY_TRADE;
            return outcome;
        } catch (const std::exception& e) {
            std::cerr << "[DualExecutionRouter] Copy-trade error: " << e.what() << std::endl;
            return domain::TargetOutcome::failure(COPY_TRADE, 500, e.what());
        }
    }
};

} // namespace gateway::application

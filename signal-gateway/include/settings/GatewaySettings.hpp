#pragma once

#include "settings/IGatewaySettings.hpp"
#include "settings/EnvReader.hpp"

namespace gateway::settings {

/**
 * @brief Режимы исполнения
 *
 * Читает из ENV:
 * - TRADING_ENABLED (default: true) — глобальный kill switch
 * - LOCAL_TEST (default: true) — dry-run
 * - FORWARD_TO_OANDA (default: true)
 * - FORWARD_TO_DUPLIKIUM (default: true)
 */
class GatewaySettings : public IGatewaySettings {
public:
    GatewaySettings() {
        tradingEnabled_ = EnvReader::getBool("TRADING_ENABLED", true);
        dryRun_ = EnvReader::getBool("LOCAL_TEST", true);
        forwardToBroker_ = EnvReader::getBool("FORWARD_TO_OANDA", true);
        forwardToCopyTrade_ = EnvReader::getBool("FORWARD_TO_DUPLIKIUM", true);
    }

    bool isTradingEnabled() const override { return tradingEnabled_; }
    bool isDryRun() const override { return dryRun_; }
    bool isBrokerForwardingEnabled() const override { return forwardToBroker_; }
    bool isCopyTradeForwardingEnabled() const override { return forwardToCopyTrade_; }

private:
    bool tradingEnabled_ = true;
    bool dryRun_ = true;
    bool forwardToBroker_ = true;
    bool forwardToCopyTrade_ = true;
};

} // namespace gateway::settings

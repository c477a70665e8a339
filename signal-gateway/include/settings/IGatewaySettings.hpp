#pragma once

namespace gateway::settings {

/**
 * @brief Режимы исполнения шлюза
 */
class IGatewaySettings {
public:
    virtual ~IGatewaySettings() = default;

    virtual bool isTradingEnabled() const = 0;      ///< kill switch
    virtual bool isDryRun() const = 0;              ///< никакие ордера не уходят из процесса
    virtual bool isBrokerForwardingEnabled() const = 0;
    virtual bool isCopyTradeForwardingEnabled() const = 0;
};

} // namespace gateway::settings

#pragma once

#include "enums/Side.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace gateway::domain {

/**
 * @brief Ордер для copy-trade relay
 *
 * clientOrderId генерируется на стороне шлюза, уникален для каждой отправки.
 */
struct CopyTradeOrder {
    std::string source;
    std::string instrument;
    Side side = Side::BUY;
    int64_t units = 0;
    double entryPrice = 0.0;
    std::optional<double> stopPrice;
    std::optional<double> targetPrice;
    std::string clientOrderId;
    std::string comment;
};

} // namespace gateway::domain

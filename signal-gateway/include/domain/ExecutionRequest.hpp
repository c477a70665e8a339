#pragma once

#include "enums/Side.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace gateway::domain {

/**
 * @brief Ордер после сайзинга, уходит на обе цели исполнения
 */
struct ExecutionRequest {
    std::string instrument;
    Side side = Side::BUY;
    int64_t units = 0;
    double entryPrice = 0.0;
    std::optional<double> stopPrice;
    std::optional<double> targetPrice;
};

} // namespace gateway::domain

#pragma once

#include "BalanceReading.hpp"
#include "DailyLossInfo.hpp"
#include "PositionSnapshot.hpp"
#include "RiskPolicy.hpp"

namespace gateway::domain {

/**
 * @brief Снимок состояния риск-контуров для GET /risk-status
 */
struct RiskStatus {
    BalanceReading balance;
    PositionSnapshot positions;
    RiskPolicy policy;
    bool tradingWindowOk = true;
    DailyLossInfo dailyLoss;
};

} // namespace gateway::domain

#pragma once

#include "BalanceReading.hpp"
#include "PositionSnapshot.hpp"
#include "LocalTime.hpp"
#include <optional>
#include <string>

namespace gateway::domain {

/**
 * @brief Контекст проверок, вычисляется заново для каждого сигнала
 */
struct GuardContext {
    std::string instrument;
    BalanceReading balance;
    std::optional<double> startOfDayBalance;
    std::optional<double> latestBalance;
    PositionSnapshot positions;
    LocalTime localTime;
    bool killSwitchEngaged = false;
    std::optional<double> stopDistance;   ///< SL в ценовых единицах, если передан
};

} // namespace gateway::domain

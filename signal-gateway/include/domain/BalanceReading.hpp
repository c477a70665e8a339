#pragma once

namespace gateway::domain {

/**
 * @brief Баланс счёта с признаком деградации
 *
 * degraded == true: upstream недоступен, amount — fallback константа.
 */
struct BalanceReading {
    double amount = 0.0;
    bool degraded = false;
};

} // namespace gateway::domain

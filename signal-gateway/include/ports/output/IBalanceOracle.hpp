#pragma once

#include "domain/BalanceReading.hpp"

namespace gateway::ports::output {

/**
 * @brief Баланс счёта для сайзинга и daily loss stop
 *
 * Никогда не бросает: при сбое upstream возвращает fallback с degraded = true.
 */
class IBalanceOracle {
public:
    virtual ~IBalanceOracle() = default;
    virtual domain::BalanceReading currentBalance() = 0;
};

} // namespace gateway::ports::output

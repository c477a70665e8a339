#pragma once

#include "Timestamp.hpp"
#include <string>

namespace gateway::domain {

/**
 * @brief Точка ряда баланса счёта
 */
struct EquitySample {
    Timestamp time;
    std::string localDate;   ///< "YYYY-MM-DD" в торговой таймзоне
    double balance = 0.0;
};

} // namespace gateway::domain

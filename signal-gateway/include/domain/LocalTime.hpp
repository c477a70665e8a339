#pragma once

#include <string>

namespace gateway::domain {

/**
 * @brief Локальное время в торговой таймзоне
 *
 * date — "YYYY-MM-DD", weekday — 0 (воскресенье) .. 6 (суббота),
 * minuteOfDay — 0 .. 1439.
 */
struct LocalTime {
    std::string date;
    int weekday = 0;
    int minuteOfDay = 0;
};

} // namespace gateway::domain

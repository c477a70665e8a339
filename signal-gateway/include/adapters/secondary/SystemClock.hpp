#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

namespace gateway::adapters::secondary {

/**
 * @brief Системные часы
 *
 * Локальное время берётся из TZ процесса; GatewayApp выставляет TZ
 * из TRADING_TZ до запуска сервера.
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }

    domain::LocalTime localNow() const override {
        auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&t, &tm);

        char date[16];
        std::snprintf(date, sizeof(date), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);

        domain::LocalTime local;
        local.date = date;
        local.weekday = tm.tm_wday;
        local.minuteOfDay = tm.tm_hour * 60 + tm.tm_min;
        return local;
    }
};

} // namespace gateway::adapters::secondary

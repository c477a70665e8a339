#pragma once

#include "domain/ExecutionOutcome.hpp"
#include "domain/enums/Side.hpp"
#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace gateway::ports::output {

/**
 * @brief Интерфейс шлюза к брокеру (основная цель исполнения)
 *
 * Read-операции возвращают nullopt при любой ошибке upstream —
 * решение о fallback принимают адаптеры-кэши.
 */
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    /**
     * @brief NAV счёта (или balance, если NAV не отдан)
     */
    virtual std::optional<double> getAccountBalance() = 0;

    /**
     * @brief Число открытых сделок по инструментам
     */
    virtual std::optional<std::map<std::string, int>> getOpenTrades() = 0;

    /**
     * @brief Рыночный ордер
     */
    virtual domain::TargetOutcome placeMarketOrder(
        const std::string& instrument,
        domain::Side side,
        int64_t units
    ) = 0;
};

} // namespace gateway::ports::output

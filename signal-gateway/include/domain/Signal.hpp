#pragma once

#include "enums/Side.hpp"
#include "enums/UnitKind.hpp"
#include <string>
#include <optional>

namespace gateway::domain {

/**
 * @brief Дистанция SL/TP в единицах клиента
 */
struct Distance {
    double value = 0.0;
    UnitKind unit = UnitKind::POINTS;
};

/**
 * @brief Входящий торговый сигнал
 *
 * Не изменяется после приёма. side/price могут отсутствовать —
 * такой сигнал отклоняется до любых guard'ов.
 */
class Signal {
public:
    std::optional<Side> side;
    std::string rawSymbol;
    std::optional<double> price;
    std::optional<Distance> stop;
    std::optional<Distance> target;
    double riskPct = 0.05;
    std::string orderId;

    Signal() = default;
};

} // namespace gateway::domain

#pragma once

#include "Timestamp.hpp"
#include "GuardDecision.hpp"
#include "ExecutionOutcome.hpp"
#include "enums/SignalStatus.hpp"
#include "enums/Side.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace gateway::domain {

/**
 * @brief Запись аудита — ровно одна на каждый сигнал
 *
 * Пишется один раз при выходе из обработки, далее не изменяется.
 * Поля, до которых обработка не дошла, остаются пустыми.
 */
struct AuditRecord {
    Timestamp time;
    std::string orderId;
    std::string rawSymbol;
    std::string instrument;
    std::optional<Side> side;
    std::optional<double> price;
    std::optional<double> stopPrice;
    std::optional<double> targetPrice;
    double requestedRiskPct = 0.0;
    std::optional<double> appliedRiskPct;
    std::optional<int64_t> units;
    std::optional<double> balance;
    bool balanceDegraded = false;

    SignalStatus status = SignalStatus::ERROR;
    std::string reason;
    std::string guard;   ///< guard, наложивший вето ("validation" для некорректного сигнала)
    std::vector<GuardDecision> guardDecisions;
    std::vector<TargetOutcome> outcomes;
};

} // namespace gateway::domain

#pragma once

#include "DailyLossInfo.hpp"
#include "enums/Side.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace gateway::domain {

/**
 * @brief Предпросмотр обработки сигнала без исполнения
 */
struct DryRunReport {
    bool allowed = true;
    std::string rawSymbol;
    std::string instrument;
    Side side = Side::BUY;
    double entry = 0.0;
    std::optional<double> stopPrice;
    std::optional<double> targetPrice;
    double requestedRiskPct = 0.0;
    double appliedRiskPct = 0.0;
    int64_t units = 0;
    bool dryRun = true;
    bool tradingWindowOk = true;
    DailyLossInfo dailyLoss;
    int openPositionsTotal = 0;
    int openPositionsForInstrument = 0;
};

} // namespace gateway::domain

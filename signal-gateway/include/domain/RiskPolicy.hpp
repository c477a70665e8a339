#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace gateway::domain {

/**
 * @brief Политика риска и допуска сигналов
 *
 * Ключи per-instrument карт и allow-list после канонизации
 * (SymbolResolver::canonicalize) — канонические id инструментов.
 */
struct RiskPolicy {
    double maxRiskPct = 0.50;
    int64_t maxUnits = 300000;
    double fallbackBalance = 1000000.0;

    std::vector<std::string> allowList;
    std::map<std::string, int64_t> instrumentUnitCaps;
    std::map<std::string, double> instrumentRiskCaps;
    std::map<std::string, double> instrumentMinStop;   ///< в ценовых единицах

    int maxOpenPositions = 0;                ///< 0 = без ограничения
    int maxOpenPerInstrument = 0;            ///< 0 = без ограничения
    std::map<std::string, int> instrumentMaxOpen;

    double dailyLossStopPct = 0.0;           ///< 0 = выключено
    std::string tradingWindow;               ///< пусто = без ограничения
    std::string timeZone = "America/Halifax";
};

} // namespace gateway::domain

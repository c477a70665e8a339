#pragma once

#include "settings/IRiskSettings.hpp"
#include "settings/EnvReader.hpp"
#include <iostream>

namespace gateway::settings {

/**
 * @brief Настройки риска и guard'ов
 *
 * Читает из ENV:
 * - MAX_RISK_PCT (default: 0.50), MAX_UNITS (default: 300000)
 * - MASTER_START_BAL (default: 1000000) — fallback баланса
 * - SYMBOL_ALLOWLIST (default: US30,NAS100,XAUUSD,EURUSD)
 * - SYMBOL_RISK_CAPS — лимит units по символу, JSON или "K:V,K:V"
 * - SYMBOL_MAX_RISK_PCT — лимит риска по символу
 * - SYMBOL_MIN_STOP — минимальный SL по символу в ценовых единицах
 * - MAX_OPEN_POSITIONS, MAX_OPEN_PER_SYMBOL, SYMBOL_MAX_OPEN
 * - DAILY_LOSS_STOP_PCT (default: 0 — выключено)
 * - TRADING_WINDOW, TRADING_TZ (default: America/Halifax)
 */
class RiskSettings : public IRiskSettings {
public:
    RiskSettings() {
        policy_.maxRiskPct = EnvReader::getDouble("MAX_RISK_PCT", 0.50);
        policy_.maxUnits = EnvReader::getInt("MAX_UNITS", 300000);
        policy_.fallbackBalance = EnvReader::getDouble("MASTER_START_BAL", 1000000.0);

        policy_.allowList = EnvReader::parseList(
            EnvReader::getEnvOrDefault("SYMBOL_ALLOWLIST", "US30,NAS100,XAUUSD,EURUSD"));

        for (const auto& [symbol, cap] : EnvReader::parseSymbolMap<int64_t>(
                 EnvReader::getEnvOrDefault("SYMBOL_RISK_CAPS", ""))) {
            if (cap >= 1) {
                policy_.instrumentUnitCaps[symbol] = cap;
            } else {
                std::cerr << "[RiskSettings] Ignoring unit cap < 1 for " << symbol << std::endl;
            }
        }
        policy_.instrumentRiskCaps = EnvReader::parseSymbolMap<double>(
            EnvReader::getEnvOrDefault("SYMBOL_MAX_RISK_PCT", ""));
        policy_.instrumentMinStop = EnvReader::parseSymbolMap<double>(
            EnvReader::getEnvOrDefault("SYMBOL_MIN_STOP", ""));

        policy_.maxOpenPositions = EnvReader::getInt("MAX_OPEN_POSITIONS", 0);
        policy_.maxOpenPerInstrument = EnvReader::getInt("MAX_OPEN_PER_SYMBOL", 0);
        policy_.instrumentMaxOpen = EnvReader::parseSymbolMap<int>(
            EnvReader::getEnvOrDefault("SYMBOL_MAX_OPEN", ""));

        policy_.dailyLossStopPct = EnvReader::getDouble("DAILY_LOSS_STOP_PCT", 0.0);
        policy_.tradingWindow = EnvReader::trim(EnvReader::getEnvOrDefault("TRADING_WINDOW", ""));
        policy_.timeZone = EnvReader::getEnvOrDefault("TRADING_TZ", "America/Halifax");

        std::cout << "[RiskSettings] maxRisk=" << policy_.maxRiskPct << "%"
                  << " maxUnits=" << policy_.maxUnits
                  << " allowList=" << policy_.allowList.size() << " symbols"
                  << " dailyLossStop=" << policy_.dailyLossStopPct << "%" << std::endl;
    }

    const domain::RiskPolicy& getPolicy() const override { return policy_; }

private:
    domain::RiskPolicy policy_;
};

} // namespace gateway::settings

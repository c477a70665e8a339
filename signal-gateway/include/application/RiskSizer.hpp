#pragma once

#include "application/SymbolResolver.hpp"
#include "domain/RiskPolicy.hpp"
#include "domain/SizingResult.hpp"
#include "settings/IRiskSettings.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <string>

namespace gateway::application {

/**
 * @brief Расчёт объёма позиции от риска на сделку
 *
 * units ≈ balance * risk% / |entry - stop|
 *
 * Процент риска ограничивается глобальным и per-instrument лимитом,
 * объём — диапазоном [1, maxUnits] и per-instrument лимитом.
 * Без валидного SL (нет, не конечен или равен entry) — 1 unit.
 */
class RiskSizer {
public:
    RiskSizer(
        std::shared_ptr<settings::IRiskSettings> settings,
        std::shared_ptr<SymbolResolver> resolver
    ) : policy_(resolver->canonicalize(settings->getPolicy()))
    {}

    virtual ~RiskSizer() = default;

    virtual domain::SizingResult size(
        const std::string& instrument,
        double balance,
        double requestedPct,
        double entry,
        std::optional<double> stop
    ) const {
        domain::SizingResult result;
        result.appliedRiskPct = appliedRiskPct(instrument, requestedPct);

        int64_t units = 1;
        if (stop && std::isfinite(*stop) && std::isfinite(entry) && *stop != entry) {
            double priceDelta = std::fabs(entry - *stop);
            double riskAmount = balance * (result.appliedRiskPct / 100.0);
            double raw = std::floor(riskAmount / priceDelta);
            units = raw >= static_cast<double>(policy_.maxUnits)
                ? policy_.maxUnits
                : static_cast<int64_t>(raw);
        }

        units = std::max<int64_t>(1, std::min<int64_t>(units, policy_.maxUnits));

        auto cap = policy_.instrumentUnitCaps.find(instrument);
        if (cap != policy_.instrumentUnitCaps.end()) {
            units = std::max<int64_t>(1, std::min<int64_t>(units, cap->second));
        }

        result.units = units;
        return result;
    }

    double appliedRiskPct(const std::string& instrument, double requestedPct) const {
        if (!std::isfinite(requestedPct)) {
            return 0.0;
        }
        double applied = std::min(requestedPct, policy_.maxRiskPct);
        auto cap = policy_.instrumentRiskCaps.find(instrument);
        if (cap != policy_.instrumentRiskCaps.end()) {
            applied = std::min(applied, cap->second);
        }
        return std::max(0.0, applied);
    }

private:
    domain::RiskPolicy policy_;
};

} // namespace gateway::application

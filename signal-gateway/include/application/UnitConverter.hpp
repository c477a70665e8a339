#pragma once

#include "application/SymbolResolver.hpp"
#include "domain/enums/UnitKind.hpp"
#include <memory>
#include <string>

namespace gateway::application {

/**
 * @brief Перевод дистанции SL/TP из pips/points в ценовые единицы
 *
 * - price  → без изменений
 * - pips   → qty * pipSize (0.0001, если не задан)
 * - points → для index/metal qty * pointSize (1.0, если не задан),
 *            для остальных qty * pipSize (0.0001, если не задан)
 *
 * Неизвестный инструмент считается FX без метаданных.
 */
class UnitConverter {
public:
    static constexpr double DEFAULT_PIP = 0.0001;
    static constexpr double DEFAULT_POINT = 1.0;

    explicit UnitConverter(std::shared_ptr<SymbolResolver> resolver)
        : resolver_(std::move(resolver))
    {}

    double toPriceDelta(const std::string& instrumentId, double qty, domain::UnitKind unit) const {
        if (unit == domain::UnitKind::PRICE) {
            return qty;
        }

        const domain::InstrumentMeta* meta = resolver_->find(instrumentId);
        double pip = (meta && meta->pipSize) ? *meta->pipSize : DEFAULT_PIP;

        if (unit == domain::UnitKind::PIPS) {
            return qty * pip;
        }

        if (meta && (meta->instrumentClass == domain::InstrumentClass::INDEX ||
                     meta->instrumentClass == domain::InstrumentClass::METAL)) {
            return qty * meta->pointSize.value_or(DEFAULT_POINT);
        }
        return qty * pip;
    }

private:
    std::shared_ptr<SymbolResolver> resolver_;
};

} // namespace gateway::application

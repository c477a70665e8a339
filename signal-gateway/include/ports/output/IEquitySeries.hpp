#pragma once

#include "domain/EquitySample.hpp"
#include <string>
#include <optional>

namespace gateway::ports::output {

/**
 * @brief Ряд баланса счёта
 *
 * Append-only. Чтение по локальной дате нужно daily loss stop
 * для восстановления баланса на начало дня.
 */
class IEquitySeries {
public:
    virtual ~IEquitySeries() = default;

    virtual void append(const domain::EquitySample& sample) = 0;
    virtual std::optional<domain::EquitySample> firstOn(const std::string& localDate) = 0;
    virtual std::optional<domain::EquitySample> latestOn(const std::string& localDate) = 0;
};

} // namespace gateway::ports::output

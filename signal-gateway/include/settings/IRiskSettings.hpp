#pragma once

#include "domain/RiskPolicy.hpp"

namespace gateway::settings {

class IRiskSettings {
public:
    virtual ~IRiskSettings() = default;

    /**
     * @brief Политика риска в виде, в котором она задана в конфигурации
     *
     * Символы — как их написал оператор (алиасы допустимы).
     */
    virtual const domain::RiskPolicy& getPolicy() const = 0;
};

} // namespace gateway::settings

#pragma once

#include "settings/EnvReader.hpp"

namespace gateway::settings {

/**
 * @brief Настройки кэширования и TTL
 *
 * Читает из ENV:
 * - CACHE_BALANCE_TTL_SECONDS (default: 15)
 * - CACHE_POSITIONS_TTL_SECONDS (default: 5)
 * - IDEMPOTENCY_TTL_SECONDS (default: 90)
 */
class CacheSettings {
public:
    CacheSettings() {
        balanceTtlSeconds_ = EnvReader::getInt("CACHE_BALANCE_TTL_SECONDS", balanceTtlSeconds_);
        positionsTtlSeconds_ = EnvReader::getInt("CACHE_POSITIONS_TTL_SECONDS", positionsTtlSeconds_);
        idempotencyTtlSeconds_ = EnvReader::getInt("IDEMPOTENCY_TTL_SECONDS", idempotencyTtlSeconds_);
    }

    CacheSettings(int balanceTtlSeconds, int positionsTtlSeconds, int idempotencyTtlSeconds)
        : balanceTtlSeconds_(balanceTtlSeconds)
        , positionsTtlSeconds_(positionsTtlSeconds)
        , idempotencyTtlSeconds_(idempotencyTtlSeconds)
    {}

    int getBalanceTtlSeconds() const { return balanceTtlSeconds_; }
    int getPositionsTtlSeconds() const { return positionsTtlSeconds_; }
    int getIdempotencyTtlSeconds() const { return idempotencyTtlSeconds_; }

private:
    int balanceTtlSeconds_ = 15;
    int positionsTtlSeconds_ = 5;
    int idempotencyTtlSeconds_ = 90;
};

} // namespace gateway::settings

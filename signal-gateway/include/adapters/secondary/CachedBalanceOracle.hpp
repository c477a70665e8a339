#pragma once

#include "ports/output/IBalanceOracle.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/IRiskSettings.hpp"
#include "utils/SingleFlight.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <cmath>
#include <memory>
#include <string>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Баланс счёта с TTL кэшем и fallback
 *
 * Кэшируются только успешные чтения. Любой сбой (нет credentials, таймаут,
 * ошибка ответа, баланс <= 0) → MASTER_START_BAL с degraded = true,
 * fallback в кэш не попадает. Одновременные промахи кэша делят один
 * запрос к брокеру.
 */
class CachedBalanceOracle : public ports::output::IBalanceOracle {
public:
    CachedBalanceOracle(
        std::shared_ptr<ports::output::IBrokerGateway> broker,
        std::shared_ptr<settings::CacheSettings> cacheSettings,
        std::shared_ptr<settings::IRiskSettings> riskSettings
    ) : broker_(std::move(broker))
      , fallback_(riskSettings->getPolicy().fallbackBalance)
    {
        auto cache = std::make_unique<Cache<std::string, double>>(
            1,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(
                std::chrono::seconds(cacheSettings->getBalanceTtlSeconds())));
        cache_ = std::make_unique<ThreadSafeCache<std::string, double>>(std::move(cache));

        std::cout << "[CachedBalanceOracle] TTL " << cacheSettings->getBalanceTtlSeconds()
                  << "s, fallback " << fallback_ << std::endl;
    }

    domain::BalanceReading currentBalance() override {
        if (auto cached = cache_->get(KEY)) {
            return domain::BalanceReading{*cached, false};
        }
        return refresh_.run([this]() { return fetch(); });
    }

private:
    static inline const std::string KEY = "balance";

    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    double fallback_;
    std::unique_ptr<ICache<std::string, double>> cache_;
    utils::SingleFlight<domain::BalanceReading> refresh_;

    domain::BalanceReading fetch() {
        // Пока ждали очереди, предыдущий запрос мог заполнить кэш
        if (auto cached = cache_->get(KEY)) {
            return domain::BalanceReading{*cached, false};
        }

        try {
            auto balance = broker_->getAccountBalance();
            if (balance && std::isfinite(*balance) && *balance > 0.0) {
                cache_->put(KEY, *balance);
                return domain::BalanceReading{*balance, false};
            }
            std::cerr << "[CachedBalanceOracle] No valid balance from broker, using fallback" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[CachedBalanceOracle] Balance read failed: " << e.what() << std::endl;
        }
        return domain::BalanceReading{fallback_, true};
    }
};

} // namespace gateway::adapters::secondary

#pragma once

#include "ports/output/IPositionCensus.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "settings/CacheSettings.hpp"
#include "utils/SingleFlight.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <string>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Счётчики открытых позиций с TTL кэшем
 *
 * При сбое брокера — нули с degraded = true (fail open), в кэш не попадают.
 * Одновременные промахи кэша делят один запрос к брокеру.
 */
class CachedPositionCensus : public ports::output::IPositionCensus {
public:
    CachedPositionCensus(
        std::shared_ptr<ports::output::IBrokerGateway> broker,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : broker_(std::move(broker))
    {
        auto cache = std::make_unique<Cache<std::string, domain::PositionSnapshot>>(
            1,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(
                std::chrono::seconds(cacheSettings->getPositionsTtlSeconds())));
        cache_ = std::make_unique<ThreadSafeCache<std::string, domain::PositionSnapshot>>(std::move(cache));
    }

    domain::PositionSnapshot openPositions() override {
        if (auto cached = cache_->get(KEY)) {
            return *cached;
        }
        return refresh_.run([this]() { return fetch(); });
    }

private:
    static inline const std::string KEY = "positions";

    std::shared_ptr<ports::output::IBrokerGateway> broker_;
    std::unique_ptr<ICache<std::string, domain::PositionSnapshot>> cache_;
    utils::SingleFlight<domain::PositionSnapshot> refresh_;

    domain::PositionSnapshot fetch() {
        if (auto cached = cache_->get(KEY)) {
            return *cached;
        }

        try {
            if (auto trades = broker_->getOpenTrades()) {
                domain::PositionSnapshot snapshot;
                snapshot.perInstrument = *trades;
                for (const auto& [instrument, count] : *trades) {
                    snapshot.total += count;
                }
                cache_->put(KEY, snapshot);
                return snapshot;
            }
        } catch (const std::exception& e) {
            std::cerr << "[CachedPositionCensus] Open trades read failed: " << e.what() << std::endl;
        }

        domain::PositionSnapshot degraded;
        degraded.degraded = true;
        return degraded;
    }
};

} // namespace gateway::adapters::secondary

#pragma once

#include <ThreadSafeMap.hpp>
#include "ports/output/IClock.hpp"
#include "settings/CacheSettings.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <iostream>

namespace gateway::application {

/**
 * @brief Фильтр повторных order_id
 *
 * Запоминает order_id на TTL (по умолчанию 90 с). Проверка и запись
 * выполняются одной атомарной операцией: из двух одновременных сигналов
 * с одинаковым id исполнение получит ровно один.
 */
class IdempotencyFilter {
public:
    IdempotencyFilter(
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::CacheSettings> settings
    ) : clock_(std::move(clock))
      , ttl_(std::chrono::seconds(settings->getIdempotencyTtlSeconds()))
    {
        std::cout << "[IdempotencyFilter] TTL " << settings->getIdempotencyTtlSeconds() << "s" << std::endl;
    }

    /**
     * @return true, если id уже встречался в пределах TTL. Пустой id — всегда false.
     */
    bool seen(const std::string& orderId) {
        auto now = clock_->now();
        auto expired = [this, &now](const domain::Timestamp& firstSeen) {
            return now.since(firstSeen) > ttl_;
        };

        entries_.eraseIf(expired);

        if (orderId.empty()) {
            return false;
        }

        bool inserted = entries_.insertIfAbsentOr(
            orderId, std::make_shared<domain::Timestamp>(now), expired);
        return !inserted;
    }

    size_t size() const { return entries_.size(); }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    std::chrono::milliseconds ttl_;
    ThreadSafeMap<std::string, domain::Timestamp> entries_;
};

} // namespace gateway::application

#pragma once

#include "ports/output/IEquitySeries.hpp"
#include "ports/output/IClock.hpp"
#include "domain/BalanceReading.hpp"
#include "domain/LocalTime.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <iostream>

namespace gateway::application {

/**
 * @brief Баланс на начало торгового дня для daily loss stop
 *
 * Каждое наблюдение здорового баланса дописывается в ряд (если отличается
 * от последнего за сегодня). Базой дня считается первая запись с текущей
 * локальной датой: после смены даты первая же запись становится новой базой,
 * записи прошлых дней никогда не используются как сегодняшняя база.
 *
 * Fallback значения (degraded) в ряд не попадают.
 *
 * Первая и последняя запись текущего дня хранятся в памяти. Ряд читается
 * только при смене даты (и при старте процесса), запись в ряд идёт вне
 * мьютекса: медленная БД не выстраивает сигналы в очередь друг за другом.
 */
class DailyBaseline {
public:
    struct Snapshot {
        std::optional<double> startOfDay;
        std::optional<double> latest;
    };

    DailyBaseline(
        std::shared_ptr<ports::output::IEquitySeries> series,
        std::shared_ptr<ports::output::IClock> clock
    ) : series_(std::move(series))
      , clock_(std::move(clock))
    {}

    Snapshot observe(const domain::BalanceReading& balance, const domain::LocalTime& local) {
        if (!isLoaded(local.date)) {
            load(local.date);
        }

        bool shouldAppend = false;
        Snapshot snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Дата могла смениться ещё раз, пока шло чтение
            if (day_.date == local.date && !balance.degraded
                && (!day_.latest || *day_.latest != balance.amount)) {
                if (!day_.first) {
                    day_.first = balance.amount;
                    std::cout << "[DailyBaseline] New baseline for " << local.date
                              << ": " << balance.amount << std::endl;
                }
                day_.latest = balance.amount;
                shouldAppend = true;
            }
            if (day_.date == local.date) {
                snapshot.startOfDay = day_.first;
                snapshot.latest = day_.latest;
            }
        }

        if (shouldAppend) {
            series_->append(domain::EquitySample{clock_->now(), local.date, balance.amount});
        }
        return snapshot;
    }

private:
    struct Day {
        std::string date;
        std::optional<double> first;
        std::optional<double> latest;
    };

    std::shared_ptr<ports::output::IEquitySeries> series_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::mutex mutex_;
    Day day_;

    bool isLoaded(const std::string& date) {
        std::lock_guard<std::mutex> lock(mutex_);
        return day_.date == date;
    }

    void load(const std::string& date) {
        Day loaded;
        loaded.date = date;
        if (auto first = series_->firstOn(date)) {
            loaded.first = first->balance;
        }
        if (auto latest = series_->latestOn(date)) {
            loaded.latest = latest->balance;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        // Даты "YYYY-MM-DD" сравниваются строкой. Параллельная загрузка
        // того же дня уже могла учесть новые наблюдения, старый день не
        // вытесняет новый.
        if (day_.date < date) {
            day_ = loaded;
        }
    }
};

} // namespace gateway::application

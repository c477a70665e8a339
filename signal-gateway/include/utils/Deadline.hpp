#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>

namespace gateway::utils {

/**
 * @brief Счётчик незавершённых удалённых вызовов одного адаптера
 *
 * Поток, брошенный по таймауту, держит слот до реального возврата из
 * upstream. Когда все слоты заняты, новый вызов сразу получает отказ:
 * зависший upstream не может накопить больше maxInFlight потоков.
 */
class InFlightLimit {
public:
    explicit InFlightLimit(int maxInFlight) : maxInFlight_(maxInFlight) {}

    bool tryAcquire() {
        int current = inFlight_.load();
        while (current < maxInFlight_) {
            if (inFlight_.compare_exchange_weak(current, current + 1)) {
                return true;
            }
        }
        return false;
    }

    void release() { inFlight_.fetch_sub(1); }

    int inFlight() const { return inFlight_.load(); }
    int maxInFlight() const { return maxInFlight_; }

private:
    const int maxInFlight_;
    std::atomic<int> inFlight_{0};
};

/**
 * @brief Выполнить fn с ограничением по времени
 *
 * fn выполняется в отдельном потоке. Если результат не готов за timeoutMs,
 * возвращается nullopt, а поток дорабатывает в фоне и его результат
 * отбрасывается. Если в limit нет свободного слота, nullopt возвращается
 * сразу, без запуска потока. Исключение из fn пробрасывается вызывающему.
 *
 * fn должен владеть всем, что использует (захват по значению / shared_ptr):
 * после таймаута вызывающий уже не ждёт.
 */
template <typename Fn>
auto runWithTimeout(const std::shared_ptr<InFlightLimit>& limit, int timeoutMs, Fn fn)
    -> std::optional<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    if (!limit->tryAcquire()) {
        return std::nullopt;
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    try {
        // packaged_task сохраняет исключение fn в future, release выполнится всегда
        std::thread([task, limit]() {
            (*task)();
            limit->release();
        }).detach();
    } catch (const std::system_error&) {
        limit->release();
        throw;
    }

    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

} // namespace gateway::utils

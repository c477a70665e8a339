#pragma once

#include <exception>
#include <future>
#include <mutex>

namespace gateway::utils {

/**
 * @brief Один upstream вызов на всех одновременных ожидающих
 *
 * Первый вызвавший run() выполняет fn, остальные, пришедшие до его
 * завершения, получают тот же результат (или то же исключение).
 */
template <typename T>
class SingleFlight {
public:
    template <typename Fn>
    T run(Fn fn) {
        std::promise<T> promise;
        std::shared_future<T> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.valid()) {
                pending = pending_;
            } else {
                pending_ = promise.get_future().share();
            }
        }
        if (pending.valid()) {
            return pending.get();
        }

        try {
            T value = fn();
            finish();
            promise.set_value(value);
            return value;
        } catch (...) {
            finish();
            promise.set_exception(std::current_exception());
            throw;
        }
    }

private:
    std::mutex mutex_;
    std::shared_future<T> pending_;

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::shared_future<T>();
    }
};

} // namespace gateway::utils

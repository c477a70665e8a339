#pragma once

#include "ports/output/IBrokerGateway.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace gateway::tests {

/**
 * @brief Mock реализация IBrokerGateway для тестов
 *
 * Вызывается из задачи router'а, поэтому счётчики атомарные.
 */
class MockBrokerGateway : public ports::output::IBrokerGateway {
public:
    // Настройка ответов
    void setBalance(std::optional<double> balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        balance_ = balance;
    }

    void setOpenTrades(std::optional<std::map<std::string, int>> trades) {
        std::lock_guard<std::mutex> lock(mutex_);
        trades_ = std::move(trades);
    }

    void setOrderOutcome(const domain::TargetOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        orderOutcome_ = outcome;
    }

    void setThrowOnOrder(bool value) { throwOnOrder_ = value; }
    void setThrowOnRead(bool value) { throwOnRead_ = value; }
    void setReadDelay(std::chrono::milliseconds delay) { readDelayMs_ = delay.count(); }

    // Счётчики вызовов
    int balanceCallCount() const { return balanceCalls_.load(); }
    int openTradesCallCount() const { return tradesCalls_.load(); }
    int orderCallCount() const { return orderCalls_.load(); }

    int64_t lastUnits() const { return lastUnits_.load(); }

    std::optional<double> getAccountBalance() override {
        ++balanceCalls_;
        pause();
        if (throwOnRead_) {
            throw std::runtime_error("broker unreachable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return balance_;
    }

    std::optional<std::map<std::string, int>> getOpenTrades() override {
        ++tradesCalls_;
        pause();
        if (throwOnRead_) {
            throw std::runtime_error("broker unreachable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return trades_;
    }

    domain::TargetOutcome placeMarketOrder(
        const std::string& instrument,
        domain::Side side,
        int64_t units
    ) override {
        ++orderCalls_;
        lastUnits_ = side == domain::Side::BUY ? units : -units;
        if (throwOnOrder_) {
            throw std::runtime_error("connection reset");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return orderOutcome_;
    }

private:
    std::mutex mutex_;
    std::optional<double> balance_ = 1000000.0;
    std::optional<std::map<std::string, int>> trades_ = std::map<std::string, int>{};
    domain::TargetOutcome orderOutcome_{"broker", true, 201, "OANDA order placed", false};
    std::atomic<bool> throwOnOrder_{false};
    std::atomic<bool> throwOnRead_{false};
    std::atomic<long long> readDelayMs_{0};

    std::atomic<int> balanceCalls_{0};
    std::atomic<int> tradesCalls_{0};
    std::atomic<int> orderCalls_{0};
    std::atomic<int64_t> lastUnits_{0};

    void pause() const {
        auto ms = readDelayMs_.load();
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }
};

} // namespace gateway::tests

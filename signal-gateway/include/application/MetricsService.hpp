#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <iostream>

namespace gateway::application {

/**
 * @brief Сервис сбора и хранения метрик
 *
 * - Потокобезопасность через shared_mutex (read) / unique_lock (write)
 * - Атомарные счётчики для инкремента без эксклюзивной блокировки
 * - Ключи из IMetricsSettings инициализируются нулями
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& key : settings_->getAllKeys()) {
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                oss << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
            }
        }

        return oss.str();
    }

    int64_t get(const std::string& name, const std::map<std::string, std::string>& labels = {}) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace gateway::application

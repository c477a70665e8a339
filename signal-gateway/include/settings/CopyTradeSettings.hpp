#pragma once

#include "settings/ICopyTradeSettings.hpp"
#include "settings/EnvReader.hpp"

namespace gateway::settings {

/**
 * @brief Подключение к Duplikium copy-trade API
 *
 * Пустой DUPLIKIUM_HOST означает "не сконфигурировано".
 */
class CopyTradeSettings : public ICopyTradeSettings {
public:
    std::string getHost() const override {
        return EnvReader::getEnvOrDefault("DUPLIKIUM_HOST", "");
    }

    int getPort() const override {
        return EnvReader::getInt("DUPLIKIUM_PORT", 80);
    }

    std::string getOrdersPath() const override {
        return EnvReader::getEnvOrDefault("DUPLIKIUM_ORDERS_PATH", "/orders");
    }

    std::string getUser() const override {
        return EnvReader::getEnvOrDefault("DUPLIKIUM_USER", "");
    }

    std::string getToken() const override {
        return EnvReader::getEnvOrDefault("DUPLIKIUM_TOKEN", "");
    }

    std::string getAuthStyle() const override {
        return EnvReader::toLower(EnvReader::getEnvOrDefault("DUPLIKIUM_AUTH_STYLE", "headers"));
    }

    std::string getMasterSource() const override {
        return EnvReader::getEnvOrDefault("DUPLIKIUM_MASTER_SOURCE", "OANDA_MASTER");
    }

    int getTimeoutMs() const override {
        return EnvReader::getInt("DUPLIKIUM_TIMEOUT_MS", 12000);
    }
};

} // namespace gateway::settings

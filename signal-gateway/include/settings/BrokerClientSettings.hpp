#pragma once

#include "settings/IBrokerClientSettings.hpp"
#include "settings/EnvReader.hpp"

namespace gateway::settings {

/**
 * @brief Подключение к OANDA v20 REST API
 *
 * Клиент говорит по plain HTTP; TLS терминирует egress-прокси,
 * адрес которого указывается в OANDA_HOST / OANDA_PORT.
 */
class BrokerClientSettings : public IBrokerClientSettings {
public:
    std::string getHost() const override {
        return EnvReader::getEnvOrDefault("OANDA_HOST", "oanda-egress");
    }

    int getPort() const override {
        return EnvReader::getInt("OANDA_PORT", 80);
    }

    std::string getToken() const override {
        return EnvReader::getEnvOrDefault("OANDA_TOKEN", "");
    }

    std::string getAccountId() const override {
        return EnvReader::getEnvOrDefault("OANDA_ACCOUNT_ID", "");
    }

    int getTimeoutMs() const override {
        return EnvReader::getInt("OANDA_TIMEOUT_MS", 10000);
    }
};

} // namespace gateway::settings

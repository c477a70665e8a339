#pragma once

#include "settings/INotifierSettings.hpp"
#include "settings/EnvReader.hpp"

namespace gateway::settings {

class NotifierSettings : public INotifierSettings {
public:
    std::string getHost() const override {
        return EnvReader::getEnvOrDefault("DISCORD_WEBHOOK_HOST", "");
    }

    int getPort() const override {
        return EnvReader::getInt("DISCORD_WEBHOOK_PORT", 80);
    }

    std::string getPath() const override {
        return EnvReader::getEnvOrDefault("DISCORD_WEBHOOK_PATH", "");
    }

    int getTimeoutMs() const override {
        return EnvReader::getInt("DISCORD_TIMEOUT_MS", 8000);
    }
};

} // namespace gateway::settings

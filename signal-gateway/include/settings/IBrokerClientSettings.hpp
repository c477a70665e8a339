#pragma once

#include <string>

namespace gateway::settings {

class IBrokerClientSettings {
public:
    virtual ~IBrokerClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getToken() const = 0;
    virtual std::string getAccountId() const = 0;
    virtual int getTimeoutMs() const = 0;
};

} // namespace gateway::settings

#pragma once

#include <string>

namespace gateway::settings {

class ICopyTradeSettings {
public:
    virtual ~ICopyTradeSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getOrdersPath() const = 0;
    virtual std::string getUser() const = 0;
    virtual std::string getToken() const = 0;
    /// "headers" | "token" | "bearer" | "basic"
    virtual std::string getAuthStyle() const = 0;
    virtual std::string getMasterSource() const = 0;
    virtual int getTimeoutMs() const = 0;
};

} // namespace gateway::settings

#pragma once

#include <string>

namespace gateway::settings {

class INotifierSettings {
public:
    virtual ~INotifierSettings() = default;

    /// Пустой host — уведомления выключены
    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getPath() const = 0;
    virtual int getTimeoutMs() const = 0;
};

} // namespace gateway::settings

// include/settings/DbSettings.hpp
#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace gateway::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (аудит и equity samples)
     *
     * Запись аудита идёт на пути запроса, поэтому и подключение, и каждый
     * запрос ограничены по времени (connect_timeout, statement_timeout).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = EnvReader::getEnvOrDefault("GATEWAY_DB_HOST", "gateway-postgres");
            port_ = EnvReader::getInt("GATEWAY_DB_PORT", 5432);
            name_ = EnvReader::getEnvOrDefault("GATEWAY_DB_NAME", "gateway_db");
            user_ = EnvReader::getEnvOrDefault("GATEWAY_DB_USER", "gateway_user");
            password_ = EnvReader::getEnvOrDefault("GATEWAY_DB_PASSWORD", "");
            connectTimeoutSec_ = EnvReader::getInt("GATEWAY_DB_CONNECT_TIMEOUT_S", 2);
            statementTimeoutMs_ = EnvReader::getInt("GATEWAY_DB_STATEMENT_TIMEOUT_MS", 2000);
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        int getConnectTimeoutSec() const { return connectTimeoutSec_; }
        int getStatementTimeoutMs() const { return statementTimeoutMs_; }

        std::string getConnectionString() const
        {
            std::string conn = "host=" + host_ + " port=" + std::to_string(port_) +
                               " dbname=" + name_ + " user=" + user_ +
                               " connect_timeout=" + std::to_string(connectTimeoutSec_) +
                               " options='-c statement_timeout=" + std::to_string(statementTimeoutMs_) + "'";
            if (!password_.empty())
            {
                conn += " password=" + password_;
            }
            return conn;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSec_;
        int statementTimeoutMs_;
    };

} // namespace gateway::settings

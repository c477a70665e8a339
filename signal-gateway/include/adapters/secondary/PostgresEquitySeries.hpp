#pragma once

#include "ports/output/IEquitySeries.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace gateway::adapters::secondary
{

    /**
     * @brief Ряд баланса в таблице equity_samples
     *
     * При недоступной БД чтение возвращает nullopt, и daily loss stop
     * ведёт себя как при отсутствии записей за день.
     */
    class PostgresEquitySeries : public gateway::ports::output::IEquitySeries
    {
    public:
        explicit PostgresEquitySeries(std::shared_ptr<gateway::settings::DbSettings> s) : settings_(std::move(s))
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                std::cout << "[PostgresEquitySeries] Connected to " << settings_->getName() << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEquitySeries] Database unavailable at startup: " << e.what() << std::endl;
            }
        }

        void append(const gateway::domain::EquitySample &sample) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                t.exec_params(
                    "INSERT INTO equity_samples (sampled_at, local_date, balance) VALUES ($1::timestamptz, $2::date, $3)",
                    sample.time.toString(), sample.localDate, sample.balance);
                t.commit();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEquitySeries] Failed to append sample: " << e.what() << std::endl;
            }
        }

        std::optional<gateway::domain::EquitySample> firstOn(const std::string &localDate) override
        {
            return findOne(localDate, "ASC");
        }

        std::optional<gateway::domain::EquitySample> latestOn(const std::string &localDate) override
        {
            return findOne(localDate, "DESC");
        }

    private:
        std::shared_ptr<gateway::settings::DbSettings> settings_;

        std::optional<gateway::domain::EquitySample> findOne(const std::string &localDate, const std::string &order)
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(
                    "SELECT balance FROM equity_samples WHERE local_date = $1::date "
                    "ORDER BY id " + order + " LIMIT 1",
                    localDate);
                if (r.empty())
                    return std::nullopt;

                gateway::domain::EquitySample sample;
                sample.localDate = localDate;
                sample.balance = r[0][0].as<double>();
                return sample;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEquitySeries] Query failed: " << e.what() << std::endl;
                return std::nullopt;
            }
        }
    };

} // namespace gateway::adapters::secondary

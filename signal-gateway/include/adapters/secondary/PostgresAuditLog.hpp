#pragma once

#include "ports/output/IAuditLog.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <iostream>

namespace gateway::adapters::secondary
{

    /**
     * @brief Журнал сигналов в таблице signal_audit
     *
     * Ошибки БД логируются и не прерывают обработку сигнала.
     */
    class PostgresAuditLog : public gateway::ports::output::IAuditLog
    {
    public:
        explicit PostgresAuditLog(std::shared_ptr<gateway::settings::DbSettings> s) : settings_(std::move(s))
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                std::cout << "[PostgresAuditLog] Connected to " << settings_->getName() << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresAuditLog] Database unavailable at startup: " << e.what() << std::endl;
            }
        }

        void append(const gateway::domain::AuditRecord &r) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                t.exec_params(
                    "INSERT INTO signal_audit (created_at, order_id, raw_symbol, instrument, side, price, "
                    "sl_price, tp_price, risk_pct_requested, risk_pct_applied, units, balance, balance_degraded, "
                    "status, reason, guard, guard_decisions, outcomes) "
                    "VALUES ($1::timestamptz, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, "
                    "$17::jsonb, $18::jsonb)",
                    r.time.toString(),
                    r.orderId,
                    r.rawSymbol,
                    nullable(r.instrument),
                    r.side ? std::optional<std::string>(gateway::domain::toString(*r.side)) : std::nullopt,
                    r.price,
                    r.stopPrice,
                    r.targetPrice,
                    r.requestedRiskPct,
                    r.appliedRiskPct,
                    r.units,
                    r.balance,
                    r.balanceDegraded,
                    gateway::domain::toString(r.status),
                    nullable(r.reason),
                    nullable(r.guard),
                    decisionsJson(r).dump(),
                    outcomesJson(r).dump());
                t.commit();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresAuditLog] Failed to append " << r.orderId << ": " << e.what() << std::endl;
            }
        }

    private:
        std::shared_ptr<gateway::settings::DbSettings> settings_;

        static std::optional<std::string> nullable(const std::string &value)
        {
            return value.empty() ? std::nullopt : std::optional<std::string>(value);
        }

        static nlohmann::json decisionsJson(const gateway::domain::AuditRecord &r)
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &d : r.guardDecisions)
            {
                arr.push_back({{"guard", d.guard}, {"passed", d.passed}, {"reason", d.reason}});
            }
            return arr;
        }

        static nlohmann::json outcomesJson(const gateway::domain::AuditRecord &r)
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &o : r.outcomes)
            {
                arr.push_back({{"target", o.target},
                               {"success", o.success},
                               {"status_code", o.statusCode},
                               {"message", o.message},
                               {"skipped", o.skipped}});
            }
            return arr;
        }
    };

} // namespace gateway::adapters::secondary

#pragma once

#include "ports/output/IAuditLog.hpp"
#include "ports/output/INotifier.hpp"
#include "ports/input/IMetricsService.hpp"
#include "application/guards/AdmissionGuards.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/Notification.hpp"
#include <memory>
#include <sstream>
#include <iostream>

namespace gateway::application {

/**
 * @brief Фиксация итога обработки сигнала: аудит, уведомление, метрика
 *
 * Вызывается ровно один раз на сигнал. Сбой любого из каналов
 * логируется и не влияет на ответ клиенту.
 */
class SignalReporter {
public:
    static constexpr int COLOR_OK = 0x2ecc71;
    static constexpr int COLOR_PARTIAL = 0xf39c12;
    static constexpr int COLOR_ERROR = 0xe74c3c;
    static constexpr int COLOR_WINDOW = 0xe67e22;
    static constexpr int COLOR_DISABLED = 0xf1c40f;
    static constexpr int COLOR_NEUTRAL = 0x95a5a6;

    SignalReporter(
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::INotifier> notifier,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : auditLog_(std::move(auditLog))
      , notifier_(std::move(notifier))
      , metrics_(std::move(metrics))
    {}

    void report(const domain::AuditRecord& record) {
        std::cout << "[SignalReporter] " << record.orderId << " " << record.rawSymbol
                  << " -> " << domain::toString(record.status)
                  << (record.reason.empty() ? "" : " (" + record.reason + ")") << std::endl;

        try {
            auditLog_->append(record);
        } catch (const std::exception& e) {
            std::cerr << "[SignalReporter] Audit append failed: " << e.what() << std::endl;
        }

        try {
            notifier_->notify(toNotification(record));
        } catch (const std::exception& e) {
            std::cerr << "[SignalReporter] Notification failed: " << e.what() << std::endl;
        }

        metrics_->increment("signals_total", {{"status", domain::toString(record.status)}});
    }

    static domain::Notification toNotification(const domain::AuditRecord& record) {
        domain::Notification n;

        switch (record.status) {
            case domain::SignalStatus::OK:
                n.title = "New Signal";
                n.color = COLOR_OK;
                break;
            case domain::SignalStatus::PARTIAL:
                n.title = "New Signal";
                n.color = COLOR_PARTIAL;
                break;
            case domain::SignalStatus::ERROR:
                n.title = record.outcomes.empty() ? "Webhook Exception" : "Execution Error";
                n.color = COLOR_ERROR;
                break;
            case domain::SignalStatus::SKIPPED:
                n.title = "Trading Disabled";
                n.color = COLOR_DISABLED;
                break;
            case domain::SignalStatus::IGNORED:
                n.title = "Duplicate Signal";
                n.color = COLOR_NEUTRAL;
                break;
            case domain::SignalStatus::REJECTED:
                if (record.guard == guards::TRADING_WINDOW) {
                    n.title = "Blocked by Trading Window";
                    n.color = COLOR_WINDOW;
                } else if (record.guard == guards::DAILY_LOSS) {
                    n.title = "Blocked by Daily Loss Stop";
                    n.color = COLOR_ERROR;
                } else {
                    n.title = "Signal Rejected";
                    n.color = COLOR_PARTIAL;
                }
                break;
        }

        n.fields.emplace_back("status", domain::toString(record.status));
        n.fields.emplace_back("order_id", record.orderId);
        n.fields.emplace_back("symbol", record.rawSymbol);
        if (!record.instrument.empty()) {
            n.fields.emplace_back("instrument", record.instrument);
        }
        if (record.side) {
            n.fields.emplace_back("side", domain::toString(*record.side));
        }
        if (record.price) {
            n.fields.emplace_back("price", format(*record.price));
        }
        if (record.units) {
            n.fields.emplace_back("units", std::to_string(*record.units));
        }
        if (record.appliedRiskPct) {
            n.fields.emplace_back("risk_pct", format(*record.appliedRiskPct));
        }
        if (record.stopPrice) {
            n.fields.emplace_back("sl", format(*record.stopPrice));
        }
        if (record.targetPrice) {
            n.fields.emplace_back("tp", format(*record.targetPrice));
        }
        for (const auto& outcome : record.outcomes) {
            n.fields.emplace_back(outcome.target, std::to_string(outcome.statusCode) + " " + outcome.message);
        }
        if (!record.reason.empty()) {
            n.fields.emplace_back("reason", record.reason);
        }
        return n;
    }

private:
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::INotifier> notifier_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static std::string format(double value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
};

} // namespace gateway::application

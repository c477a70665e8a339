#pragma once

#include "domain/Signal.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/DailyLossInfo.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cctype>
#include <optional>
#include <string>

namespace gateway::adapters::primary {

/**
 * @brief JSON ↔ доменные типы для webhook / dryrun
 *
 * Числовые поля принимаются и числом, и строкой ("39250.5") — так
 * их присылают алерты TradingView.
 */
class SignalJson {
public:
    static std::optional<double> number(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            return std::nullopt;
        }
        const auto& value = body[key];
        std::optional<double> parsed;
        if (value.is_number()) {
            parsed = value.get<double>();
        } else if (value.is_string()) {
            const auto& str = value.get_ref<const std::string&>();
            try {
                size_t consumed = 0;
                double d = std::stod(str, &consumed);
                if (consumed == str.size()) {
                    parsed = d;
                }
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        // stod принимает "nan" и "inf"
        if (parsed && !std::isfinite(*parsed)) {
            return std::nullopt;
        }
        return parsed;
    }

    static std::string text(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            return "";
        }
        const auto& value = body[key];
        return value.is_string() ? value.get<std::string>() : value.dump();
    }

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    /**
     * @brief Сигнал из тела POST /webhook
     *
     * side берётся из "action", иначе из "signal". Отсутствующие поля
     * остаются пустыми, их проверяет SignalService.
     */
    static domain::Signal parseSignal(const nlohmann::json& body) {
        domain::Signal signal;

        std::string action = text(body, "action");
        if (action.empty()) {
            action = text(body, "signal");
        }
        signal.side = domain::parseSide(action);
        signal.rawSymbol = upper(text(body, "symbol"));
        signal.price = number(body, "price");
        signal.orderId = text(body, "order_id");

        if (auto sl = number(body, "sl")) {
            signal.stop = domain::Distance{*sl, domain::parseUnitKind(text(body, "sl_type"))};
        }
        if (auto tp = number(body, "tp")) {
            signal.target = domain::Distance{*tp, domain::parseUnitKind(text(body, "tp_type"))};
        }
        if (auto risk = number(body, "risk_pct")) {
            signal.riskPct = *risk;
        }
        return signal;
    }

    static nlohmann::json optionalNumber(const std::optional<double>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    static nlohmann::json outcome(const domain::TargetOutcome& o) {
        return {
            {"success", o.success},
            {"status_code", o.statusCode},
            {"message", o.message},
            {"skipped", o.skipped}
        };
    }

    static nlohmann::json dailyLoss(const domain::DailyLossInfo& info) {
        nlohmann::json j;
        j["enabled"] = info.enabled;
        if (!info.enabled) {
            return j;
        }
        j["start_balance"] = optionalNumber(info.startBalance);
        j["balance_now"] = optionalNumber(info.balanceNow);
        j["drawdown_pct"] = std::round(info.drawdownPct * 10000.0) / 10000.0;
        j["limit_pct"] = info.limitPct;
        return j;
    }
};

} // namespace gateway::adapters::primary

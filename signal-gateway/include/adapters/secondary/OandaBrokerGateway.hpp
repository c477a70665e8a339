#pragma once

#include "ports/output/IBrokerGateway.hpp"
#include "settings/IBrokerClientSettings.hpp"
#include "utils/Deadline.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <iostream>
#include <utility>

namespace gateway::adapters::secondary {

/**
 * @brief HTTP клиент к OANDA v20 REST API
 *
 * - GET  /v3/accounts/{id}/summary     → NAV (или balance)
 * - GET  /v3/accounts/{id}/openTrades  → число сделок по инструментам
 * - POST /v3/accounts/{id}/orders      → рыночный ордер
 *
 * Каждый вызов ограничен OANDA_TIMEOUT_MS, одновременно в работе не больше
 * MAX_IN_FLIGHT запросов (включая брошенные по таймауту). Read-операции при
 * любой ошибке возвращают nullopt, ордер — неуспешный TargetOutcome.
 */
class OandaBrokerGateway : public ports::output::IBrokerGateway {
public:
    static constexpr int MAX_IN_FLIGHT = 8;

    OandaBrokerGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IBrokerClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[OandaBrokerGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::optional<double> getAccountBalance() override {
        if (!hasCredentials()) {
            std::cerr << "[OandaBrokerGateway] Missing OANDA credentials" << std::endl;
            return std::nullopt;
        }

        try {
            auto response = send("GET", accountPath() + "/summary", "");
            if (!response) {
                std::cerr << "[OandaBrokerGateway] getAccountBalance timed out or too many calls in flight" << std::endl;
                return std::nullopt;
            }
            if (response->getStatus() != 200) {
                std::cerr << "[OandaBrokerGateway] getAccountBalance failed: " << response->getStatus() << std::endl;
                return std::nullopt;
            }

            auto json = nlohmann::json::parse(response->getBody());
            const auto& account = json.at("account");

            // v20 отдаёт суммы строками
            for (const char* field : {"NAV", "balance"}) {
                if (account.contains(field) && !account[field].is_null()) {
                    return toDouble(account[field]);
                }
            }
            std::cerr << "[OandaBrokerGateway] Account summary without NAV/balance" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OandaBrokerGateway] getAccountBalance error: " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    std::optional<std::map<std::string, int>> getOpenTrades() override {
        if (!hasCredentials()) {
            return std::nullopt;
        }

        try {
            auto response = send("GET", accountPath() + "/openTrades", "");
            if (!response || response->getStatus() != 200) {
                std::cerr << "[OandaBrokerGateway] getOpenTrades failed: "
                          << (response ? std::to_string(response->getStatus()) : "timeout / busy") << std::endl;
                return std::nullopt;
            }

            auto json = nlohmann::json::parse(response->getBody());
            std::map<std::string, int> counts;
            for (const auto& trade : json.value("trades", nlohmann::json::array())) {
                counts[trade.at("instrument").get<std::string>()]++;
            }
            return counts;
        } catch (const std::exception& e) {
            std::cerr << "[OandaBrokerGateway] getOpenTrades error: " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    domain::TargetOutcome placeMarketOrder(
        const std::string& instrument,
        domain::Side side,
        int64_t units
    ) override {
        if (!hasCredentials()) {
            return domain::TargetOutcome::failure("broker", 401, "OANDA credentials not set");
        }

        nlohmann::json body;
        body["order"] = {
            {"instrument", instrument},
            {"units", std::to_string(side == domain::Side::BUY ? units : -units)},
            {"type", "MARKET"},
            {"positionFill", "DEFAULT"}
        };

        try {
            auto response = send("POST", accountPath() + "/orders", body.dump());
            if (!response) {
                return domain::TargetOutcome::failure("broker", 504, "OANDA order timed out or too many calls in flight");
            }

            int status = response->getStatus();
            if (status < 200 || status >= 300) {
                return domain::TargetOutcome::failure("broker", status, "OANDA order failed: " + response->getBody());
            }

            auto json = nlohmann::json::parse(response->getBody());
            if (json.contains("orderCancelTransaction")) {
                std::string reason = json["orderCancelTransaction"].value("reason", "cancelled");
                return domain::TargetOutcome::failure("broker", status, "OANDA order cancelled: " + reason);
            }

            std::string id;
            if (json.contains("orderFillTransaction")) {
                id = json["orderFillTransaction"].value("id", "");
            } else if (json.contains("orderCreateTransaction")) {
                id = json["orderCreateTransaction"].value("id", "");
            }
            return domain::TargetOutcome{"broker", true, status, "OANDA order placed" + (id.empty() ? "" : " #" + id), false};
        } catch (const std::exception& e) {
            std::cerr << "[OandaBrokerGateway] placeMarketOrder error: " << e.what() << std::endl;
            return domain::TargetOutcome::failure("broker", 500, std::string("OANDA order failed: ") + e.what());
        }
    }

    int inFlightCalls() const { return inFlight_->inFlight(); }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IBrokerClientSettings> settings_;
    std::shared_ptr<utils::InFlightLimit> inFlight_ = std::make_shared<utils::InFlightLimit>(MAX_IN_FLIGHT);

    bool hasCredentials() const {
        return !settings_->getToken().empty() && !settings_->getAccountId().empty();
    }

    std::string accountPath() const {
        return "/v3/accounts/" + settings_->getAccountId();
    }

    std::optional<SimpleResponse> send(const std::string& method, const std::string& path, const std::string& body) {
        std::map<std::string, std::string> headers{
            {"Authorization", "Bearer " + settings_->getToken()},
            {"Content-Type", "application/json"},
            {"Accept-Datetime-Format", "RFC3339"}
        };
        SimpleRequest request(method, path, body, settings_->getHost(), settings_->getPort(), headers);

        auto client = httpClient_;
        return utils::runWithTimeout(inFlight_, settings_->getTimeoutMs(), [client, request]() {
            SimpleResponse response;
            if (!client->send(request, response)) {
                response.setStatus(502);
            }
            return response;
        });
    }

    static double toDouble(const nlohmann::json& value) {
        if (value.is_string()) {
            return std::stod(value.get<std::string>());
        }
        return value.get<double>();
    }
};

} // namespace gateway::adapters::secondary

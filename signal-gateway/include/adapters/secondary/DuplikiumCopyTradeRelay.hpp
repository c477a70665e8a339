#pragma once

#include "ports/output/ICopyTradeRelay.hpp"
#include "settings/ICopyTradeSettings.hpp"
#include "utils/Deadline.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <map>
#include <memory>
#include <string>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief HTTP клиент к Duplikium copy-trade API
 *
 * POST {DUPLIKIUM_ORDERS_PATH} с ордером мастер-счёта; Duplikium
 * масштабирует объём на подписанные счета.
 *
 * Авторизация (DUPLIKIUM_AUTH_STYLE):
 * - headers / token → X-Auth-Username + X-Auth-Token
 * - bearer          → Authorization: Bearer <token>
 * - basic           → Authorization: Basic base64(user:token)
 */
class DuplikiumCopyTradeRelay : public ports::output::ICopyTradeRelay {
public:
    static constexpr int MAX_IN_FLIGHT = 8;

    DuplikiumCopyTradeRelay(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::ICopyTradeSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[DuplikiumCopyTradeRelay] Created, target: "
                  << (settings_->getHost().empty() ? "<not configured>" : settings_->getHost())
                  << ", auth: " << settings_->getAuthStyle() << std::endl;
    }

    domain::TargetOutcome forward(const domain::CopyTradeOrder& order) override {
        if (settings_->getHost().empty()) {
            return domain::TargetOutcome::failure("copy_trade", 400, "DUPLIKIUM_HOST not set");
        }

        try {
            SimpleRequest request(
                "POST",
                settings_->getOrdersPath(),
                toJson(order).dump(),
                settings_->getHost(),
                settings_->getPort(),
                buildHeaders()
            );

            auto client = httpClient_;
            auto response = utils::runWithTimeout(inFlight_, settings_->getTimeoutMs(), [client, request]() {
                SimpleResponse res;
                if (!client->send(request, res)) {
                    res.setStatus(502);
                }
                return res;
            });

            if (!response) {
                return domain::TargetOutcome::failure("copy_trade", 504, "Duplikium request timed out or too many calls in flight");
            }

            int status = response->getStatus();
            bool ok = status >= 200 && status < 300;
            if (!ok) {
                std::cerr << "[DuplikiumCopyTradeRelay] Forward failed: " << status
                          << " " << response->getBody() << std::endl;
            }
            return domain::TargetOutcome{"copy_trade", ok, status, response->getBody(), false};
        } catch (const std::exception& e) {
            std::cerr << "[DuplikiumCopyTradeRelay] Forward error: " << e.what() << std::endl;
            return domain::TargetOutcome::failure("copy_trade", 500, e.what());
        }
    }

    static nlohmann::json toJson(const domain::CopyTradeOrder& order) {
        nlohmann::json j;
        j["source"] = order.source;
        j["symbol"] = order.instrument;
        j["side"] = domain::toString(order.side);
        j["orderType"] = "MARKET";
        j["units"] = order.units;
        j["entryPrice"] = order.entryPrice;
        j["slPrice"] = order.stopPrice ? nlohmann::json(*order.stopPrice) : nlohmann::json(nullptr);
        j["tpPrice"] = order.targetPrice ? nlohmann::json(*order.targetPrice) : nlohmann::json(nullptr);
        j["clientOrderId"] = order.clientOrderId;
        j["comment"] = order.comment;
        return j;
    }

    static std::string base64(const std::string& input) {
        using namespace boost::archive::iterators;
        using Base64Iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

        std::string encoded(Base64Iterator(input.begin()), Base64Iterator(input.end()));
        encoded.append((3 - input.size() % 3) % 3, '=');
        return encoded;
    }

    int inFlightCalls() const { return inFlight_->inFlight(); }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::ICopyTradeSettings> settings_;
    std::shared_ptr<utils::InFlightLimit> inFlight_ = std::make_shared<utils::InFlightLimit>(MAX_IN_FLIGHT);

    std::map<std::string, std::string> buildHeaders() const {
        std::map<std::string, std::string> headers{{"Content-Type", "application/json"}};
        std::string style = settings_->getAuthStyle();

        if (style == "bearer") {
            headers["Authorization"] = "Bearer " + settings_->getToken();
        } else if (style == "basic") {
            headers["Authorization"] = "Basic " + base64(settings_->getUser() + ":" + settings_->getToken());
        } else if (style == "headers" || style == "token") {
            headers["X-Auth-Username"] = settings_->getUser();
            headers["X-Auth-Token"] = settings_->getToken();
        }
        return headers;
    }
};

} // namespace gateway::adapters::secondary

#pragma once

#include "ports/output/INotifier.hpp"
#include "settings/INotifierSettings.hpp"
#include "domain/Timestamp.hpp"
#include "utils/Deadline.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <thread>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Уведомления в Discord webhook (embed)
 *
 * notify() возвращает управление сразу: отправка идёт в отдельном
 * потоке с собственным таймаутом, ошибки только логируются.
 * Без DISCORD_WEBHOOK_HOST / DISCORD_WEBHOOK_PATH уведомления выключены.
 */
class DiscordNotifier : public ports::output::INotifier {
public:
    static constexpr int MAX_IN_FLIGHT = 4;

    DiscordNotifier(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::INotifierSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[DiscordNotifier] " << (isEnabled() ? "Enabled" : "Disabled") << std::endl;
    }

    bool isEnabled() const {
        return !settings_->getHost().empty() && !settings_->getPath().empty();
    }

    void notify(const domain::Notification& notification) override {
        if (!isEnabled()) {
            return;
        }

        SimpleRequest request(
            "POST",
            settings_->getPath(),
            toPayload(notification).dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        auto client = httpClient_;
        auto inFlight = inFlight_;
        int timeoutMs = settings_->getTimeoutMs();
        std::thread([client, request, inFlight, timeoutMs]() {
            try {
                auto status = utils::runWithTimeout(inFlight, timeoutMs, [client, request]() {
                    SimpleResponse response;
                    return client->send(request, response) ? response.getStatus() : 0;
                });
                if (!status) {
                    std::cerr << "[DiscordNotifier] Timed out or too many calls in flight, dropped" << std::endl;
                } else if (*status < 200 || *status >= 300) {
                    std::cerr << "[DiscordNotifier] Failed: " << *status << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[DiscordNotifier] Error: " << e.what() << std::endl;
            }
        }).detach();
    }

    static nlohmann::json toPayload(const domain::Notification& notification) {
        nlohmann::json fields = nlohmann::json::array();
        for (const auto& [name, value] : notification.fields) {
            fields.push_back({{"name", name}, {"value", value.empty() ? "-" : value}, {"inline", true}});
        }

        nlohmann::json embed;
        embed["title"] = notification.title;
        embed["color"] = notification.color;
        embed["fields"] = fields;
        embed["timestamp"] = domain::Timestamp::now().toString();

        nlohmann::json payload;
        payload["embeds"] = nlohmann::json::array({embed});
        return payload;
    }

    int inFlightCalls() const { return inFlight_->inFlight(); }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::INotifierSettings> settings_;
    std::shared_ptr<utils::InFlightLimit> inFlight_ = std::make_shared<utils::InFlightLimit>(MAX_IN_FLIGHT);
};

} // namespace gateway::adapters::secondary

// include/GatewayApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/GatewaySettings.hpp"
#include "settings/RiskSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/BrokerClientSettings.hpp"
#include "settings/CopyTradeSettings.hpp"
#include "settings/NotifierSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include "settings/InstrumentCatalogSettings.hpp"

// Ports
#include "ports/input/ISignalService.hpp"
#include "ports/input/IRiskStatusService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IBrokerGateway.hpp"
#include "ports/output/ICopyTradeRelay.hpp"
#include "ports/output/IBalanceOracle.hpp"
#include "ports/output/IPositionCensus.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEquitySeries.hpp"
#include "ports/output/INotifier.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/SignalService.hpp"
#include "application/RiskStatusService.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/OandaBrokerGateway.hpp"
#include "adapters/secondary/CachedBalanceOracle.hpp"
#include "adapters/secondary/CachedPositionCensus.hpp"
#include "adapters/secondary/DuplikiumCopyTradeRelay.hpp"
#include "adapters/secondary/DiscordNotifier.hpp"
#include "adapters/secondary/PostgresAuditLog.hpp"
#include "adapters/secondary/PostgresEquitySeries.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/WebhookHandler.hpp"
#include "adapters/primary/DryRunHandler.hpp"
#include "adapters/primary/RiskStatusHandler.hpp"
#include "adapters/primary/EnvCheckHandler.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>

namespace di = boost::di;

namespace gateway
{

    /**
     * @brief Signal Gateway Application
     *
     * Принимает сигналы TradingView (POST /webhook), проверяет их цепочкой guard'ов,
     * считает объём от риска и отправляет ордер в OANDA и Duplikium.
     */
    class GatewayApp : public BoostBeastApplication
    {
    public:
        GatewayApp() { std::cout << "[GatewayApp] Initializing..." << std::endl; }
        ~GatewayApp() override { std::cout << "[GatewayApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);

            // Торговое окно и границы дня считаются в TRADING_TZ
            std::string tz = settings::EnvReader::getEnvOrDefault("TRADING_TZ", "America/Halifax");
            setenv("TZ", tz.c_str(), 1);
            tzset();

            std::cout << "[GatewayApp] Environment loaded, TZ=" << tz << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[GatewayApp] Configuring DI..." << std::endl;

            // Настройки с несколькими конструкторами создаём явно
            auto cacheSettings = std::make_shared<settings::CacheSettings>();
            auto catalogSettings = std::make_shared<settings::InstrumentCatalogSettings>();

            auto injector = di::make_injector(
                di::bind<settings::CacheSettings>().to(cacheSettings),
                di::bind<settings::InstrumentCatalogSettings>().to(catalogSettings),
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::IGatewaySettings>().to<settings::GatewaySettings>().in(di::singleton),
                di::bind<settings::IRiskSettings>().to<settings::RiskSettings>().in(di::singleton),
                di::bind<settings::IBrokerClientSettings>().to<settings::BrokerClientSettings>().in(di::singleton),
                di::bind<settings::ICopyTradeSettings>().to<settings::CopyTradeSettings>().in(di::singleton),
                di::bind<settings::INotifierSettings>().to<settings::NotifierSettings>().in(di::singleton),
                di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
                di::bind<ports::output::IBrokerGateway>().to<adapters::secondary::OandaBrokerGateway>().in(di::singleton),
                di::bind<ports::output::ICopyTradeRelay>().to<adapters::secondary::DuplikiumCopyTradeRelay>().in(di::singleton),
                di::bind<ports::output::IBalanceOracle>().to<adapters::secondary::CachedBalanceOracle>().in(di::singleton),
                di::bind<ports::output::IPositionCensus>().to<adapters::secondary::CachedPositionCensus>().in(di::singleton),
                di::bind<ports::output::IAuditLog>().to<adapters::secondary::PostgresAuditLog>().in(di::singleton),
                di::bind<ports::output::IEquitySeries>().to<adapters::secondary::PostgresEquitySeries>().in(di::singleton),
                di::bind<ports::output::INotifier>().to<adapters::secondary::DiscordNotifier>().in(di::singleton),

                di::bind<application::SymbolResolver>().in(di::singleton),
                di::bind<application::IdempotencyFilter>().in(di::singleton),
                di::bind<application::DailyBaseline>().in(di::singleton),
                di::bind<application::GuardContextProvider>().in(di::singleton),
                di::bind<application::RiskSizer>().in(di::singleton),
                di::bind<application::DualExecutionRouter>().in(di::singleton),
                di::bind<application::SignalReporter>().in(di::singleton),

                di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
                di::bind<ports::input::ISignalService>().to<application::SignalService>().in(di::singleton),
                di::bind<ports::input::IRiskStatusService>().to<application::RiskStatusService>().in(di::singleton));

            // HTTP Handlers: каждый запрос сначала проходит через MetricsMiddleware
            auto metricsMiddleware = injector.create<std::shared_ptr<serverlib::MetricsMiddleware>>();
            auto withMetrics = [&metricsMiddleware](std::shared_ptr<IHttpHandler> handler)
            {
                return std::make_shared<serverlib::ChainHandler>(metricsMiddleware, std::move(handler));
            };

            auto healthHandler = withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
            handlers_[getHandlerKey("GET", "/")] = healthHandler;
            handlers_[getHandlerKey("GET", "/health")] = healthHandler;
            handlers_[getHandlerKey("GET", "/metrics")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

            handlers_[getHandlerKey("POST", "/webhook")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::WebhookHandler>>());
            handlers_[getHandlerKey("POST", "/dryrun")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::DryRunHandler>>());
            handlers_[getHandlerKey("GET", "/risk-status")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::RiskStatusHandler>>());
            handlers_[getHandlerKey("GET", "/env-check")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::EnvCheckHandler>>());

            auto gatewaySettings = injector.create<std::shared_ptr<settings::IGatewaySettings>>();
            std::cout << "[GatewayApp] Ready"
                      << " dry_run=" << std::boolalpha << gatewaySettings->isDryRun()
                      << " trading_enabled=" << gatewaySettings->isTradingEnabled() << std::endl;
        }
    };

} // namespace gateway

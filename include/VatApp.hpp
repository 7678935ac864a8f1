#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/AggregatorClientSettings.hpp"
#include "settings/ClientRegistrySettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/IVatPeriodService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IVatPeriodRepository.hpp"
#include "ports/output/IVatAggregator.hpp"
#include "ports/output/IClientRegistry.hpp"

// Application
#include "application/PeriodLedger.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresVatPeriodRepository.hpp"
#include "adapters/secondary/InMemoryVatPeriodRepository.hpp"
#include "adapters/secondary/HttpVatAggregator.hpp"
#include "adapters/secondary/HttpClientRegistry.hpp"
#include "adapters/secondary/CachedClientRegistry.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/CalculatorHandler.hpp"
#include "adapters/primary/ListPeriodsHandler.hpp"
#include "adapters/primary/GetPeriodHandler.hpp"
#include "adapters/primary/PeriodCommandHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace vat
{

    /**
     * @brief VAT Period Reconciliation Service
     *
     * HTTP: расчёт периода, список/просмотр, set-credit/reset-credit, lock/unlock.
     * Хранилище: PostgreSQL или in-memory (VAT_STORAGE).
     */
    class VatApp : public BoostBeastApplication
    {
    public:
        VatApp() { std::cout << "[VatApp] Initializing..." << std::endl; }
        ~VatApp() override { std::cout << "[VatApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[VatApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[VatApp] Configuring DI..." << std::endl;

            // Шаг 1: Хранилище выбирается по VAT_STORAGE
            auto storage = std::make_shared<settings::StorageSettings>();
            auto repository = createRepository(*storage);

            // Шаг 2: Основной injector с instance binding для репозитория
            auto injector = di::make_injector(
                di::bind<settings::StorageSettings>().to(storage),
                di::bind<settings::IAggregatorClientSettings>().to<settings::AggregatorClientSettings>().in(di::singleton),
                di::bind<settings::ClientRegistrySettings>().in(di::singleton),
                di::bind<settings::CacheSettings>().in(di::singleton),
                di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

                di::bind<ports::output::IVatPeriodRepository>().to(repository),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IVatAggregator>().to<adapters::secondary::HttpVatAggregator>().in(di::singleton),
                di::bind<adapters::secondary::HttpClientRegistry>().in(di::singleton),
                di::bind<ports::output::IClientRegistry>().to<adapters::secondary::CachedClientRegistry>().in(di::singleton),

                di::bind<ports::input::IVatPeriodService>().to<application::PeriodLedger>().in(di::singleton),
                di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton));

            // Шаг 3: HTTP Handlers, каждый обёрнут декоратором метрик
            metrics_ = injector.create<std::shared_ptr<ports::input::IMetricsService>>();

            route("GET", "/health", injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
            route("GET", "/metrics", injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

            route("GET", "/api/v1/vat/calculator", injector.create<std::shared_ptr<adapters::primary::CalculatorHandler>>());
            route("GET", "/api/v1/vat/periods", injector.create<std::shared_ptr<adapters::primary::ListPeriodsHandler>>());
            route("GET", "/api/v1/vat/periods/*", injector.create<std::shared_ptr<adapters::primary::GetPeriodHandler>>());

            auto commandHandler = injector.create<std::shared_ptr<adapters::primary::PeriodCommandHandler>>();
            route("POST", "/api/v1/vat/periods/*/calculate", commandHandler);
            route("POST", "/api/v1/vat/periods/*/set-credit", commandHandler);
            route("POST", "/api/v1/vat/periods/*/reset-credit", commandHandler);
            route("POST", "/api/v1/vat/periods/*/lock", commandHandler);
            route("POST", "/api/v1/vat/periods/*/unlock", commandHandler);

            std::cout << "[VatApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<ports::input::IMetricsService> metrics_;

        static std::shared_ptr<ports::output::IVatPeriodRepository> createRepository(const settings::StorageSettings &storage)
        {
            if (storage.useInMemory())
            {
                std::cout << "[VatApp] Storage: in-memory" << std::endl;
                return std::make_shared<adapters::secondary::InMemoryVatPeriodRepository>();
            }

            std::cout << "[VatApp] Storage: postgres" << std::endl;
            auto dbInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton));
            return dbInjector.create<std::shared_ptr<adapters::secondary::PostgresVatPeriodRepository>>();
        }

        void route(const std::string &method, const std::string &pattern, std::shared_ptr<IHttpHandler> handler)
        {
            handlers_[getHandlerKey(method, pattern)] =
                std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics_);
        }
    };

} // namespace vat

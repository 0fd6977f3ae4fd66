#include "GreetingApp.hpp"
#include "adapters/primary/GreetingHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/NotFoundHandler.hpp"
#include "settings/GreetingSettings.hpp"
#include "settings/ServerSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace greeting {

GreetingApp::GreetingApp()
{
    std::cout << "[GreetingApp] Application created" << std::endl;
}

GreetingApp::~GreetingApp()
{
    std::cout << "[GreetingApp] Application destroyed" << std::endl;
}

void GreetingApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[GreetingApp] Loading environment..." << std::endl;

    BeastApplication::loadEnvironment(argc, argv);

    std::cout << "[GreetingApp] Environment loaded" << std::endl;
}

void GreetingApp::configureInjection()
{
    std::cout << "[GreetingApp] Configuring dependency injection..." << std::endl;

    // Шаг 1: settings (di::singleton общий на процесс, поэтому unique + instance binding)
    auto settingsInjector = di::make_injector(
        di::bind<config::IEnvironment>().to(env_),
        di::bind<settings::ServerSettings>().in(di::unique),
        di::bind<settings::GreetingSettings>().in(di::unique));

    auto serverSettings = settingsInjector.create<std::shared_ptr<settings::ServerSettings>>();
    auto greetingSettings = settingsInjector.create<std::shared_ptr<settings::GreetingSettings>>();

    // Шаг 2: handlers
    auto injector = di::make_injector(
        di::bind<settings::IServerSettings>().to(serverSettings),
        di::bind<settings::IGreetingSettings>().to(greetingSettings),
        di::bind<adapters::primary::GreetingHandler>().in(di::unique),
        di::bind<adapters::primary::HealthHandler>().in(di::unique));

    serverSettings_ = serverSettings;

    handlers_[getHandlerKey("GET", "/")] =
        injector.create<std::shared_ptr<adapters::primary::GreetingHandler>>();
    std::cout << "[GreetingApp] Registered: GET /" << std::endl;

    handlers_[getHandlerKey("GET", "/health")] =
        injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
    std::cout << "[GreetingApp] Registered: GET /health" << std::endl;

    notFoundHandler_ = std::make_shared<adapters::primary::NotFoundHandler>();

    std::cout << "[GreetingApp] DI configuration completed" << std::endl;
}

} // namespace greeting

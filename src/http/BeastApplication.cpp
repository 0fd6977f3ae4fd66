#include "http/BeastApplication.hpp"
#include "config/Environment.hpp"

#include <iostream>
#include <stdexcept>

namespace greeting::http {

BeastApplication::BeastApplication() = default;

BeastApplication::~BeastApplication()
{
    stop();
}

void BeastApplication::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void BeastApplication::loadEnvironment(int argc, char* argv[])
{
    env_ = config::Environment::fromArgs(argc, argv);
}

void BeastApplication::start()
{
    if (!serverSettings_)
    {
        throw std::logic_error("configureInjection() did not provide server settings");
    }
    if (!notFoundHandler_)
    {
        throw std::logic_error("configureInjection() did not provide a not-found handler");
    }

    std::shared_ptr<const Router> router = std::make_shared<Router>(handlers_, notFoundHandler_);
    auto server = std::make_shared<HttpServer>(serverSettings_, router);

    // Порт занимается ровно один раз; ошибка bind уходит наружу до цикла
    server->listen();
    server->stopOnSignals();

    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        if (stopRequested_)
        {
            std::cout << "[BeastApplication] Stop requested before start" << std::endl;
            return;
        }
        server_ = server;
    }

    std::cout << "App running on port " << server->getPort() << std::endl;
    server->run();

    std::lock_guard<std::mutex> lock(serverMutex_);
    server_.reset();
}

void BeastApplication::stop()
{
    std::lock_guard<std::mutex> lock(serverMutex_);
    stopRequested_ = true;
    if (server_)
    {
        server_->stop();
    }
}

bool BeastApplication::isListening() const
{
    std::lock_guard<std::mutex> lock(serverMutex_);
    return server_ && server_->isListening();
}

uint16_t BeastApplication::getPort() const
{
    std::lock_guard<std::mutex> lock(serverMutex_);
    return server_ ? server_->getPort() : 0;
}

} // namespace greeting::http

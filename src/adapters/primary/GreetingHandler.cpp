#include "adapters/primary/GreetingHandler.hpp"

#include <iostream>
#include <stdexcept>

namespace greeting::adapters::primary {

namespace {

std::string messageFrom(const std::shared_ptr<settings::IGreetingSettings>& settings)
{
    if (!settings)
    {
        throw std::invalid_argument("GreetingHandler requires settings");
    }
    return settings->getMessage();
}

} // namespace

GreetingHandler::GreetingHandler(std::shared_ptr<settings::IGreetingSettings> settings)
    : message_(messageFrom(settings))
{
    std::cout << "[GreetingHandler] Created" << std::endl;
}

void GreetingHandler::handle(http::IRequest& req, http::IResponse& res)
{
    std::cout << "[GreetingHandler] " << req.getMethod() << " " << req.getPath()
              << " from " << req.getIp() << std::endl;

    res.setResult(200, "text/plain; charset=utf-8", message_);
}

} // namespace greeting::adapters::primary

#include "http/Router.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace greeting::http {

Router::Router(HandlerMap handlers, std::shared_ptr<IHttpHandler> fallback)
    : handlers_(std::move(handlers))
    , fallback_(std::move(fallback))
{
    if (!fallback_)
    {
        throw std::invalid_argument("Router requires a fallback handler");
    }

    for (const auto& [key, handler] : handlers_)
    {
        if (!handler)
        {
            throw std::invalid_argument("Null handler registered for " + key);
        }
    }
}

std::string Router::getHandlerKey(const std::string& method, const std::string& path)
{
    return method + " " + path;
}

std::shared_ptr<IHttpHandler> Router::find(const std::string& method, const std::string& path) const
{
    auto it = handlers_.find(getHandlerKey(method, path));
    return it != handlers_.end() ? it->second : nullptr;
}

void Router::dispatch(IRequest& req, IResponse& res) const
{
    const std::string method = req.getMethod();
    const std::string path = req.getPath();

    auto handler = find(method, path);
    if (!handler && method == "HEAD")
    {
        handler = find("GET", path);
    }
    if (!handler)
    {
        handler = fallback_;
    }

    try
    {
        handler->handle(req, res);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[Router] Handler failed for " << method << " " << path
                  << ": " << e.what() << std::endl;
        res.setResult(500, "application/json", R"({"error": "Internal server error"})");
    }

    if (method == "HEAD")
    {
        auto length = res.getBody().size();
        res.setBody("");
        res.setHeader("Content-Length", std::to_string(length));
    }
}

} // namespace greeting::http

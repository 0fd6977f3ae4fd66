#include "adapters/primary/NotFoundHandler.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace greeting::adapters::primary {

void NotFoundHandler::handle(http::IRequest& req, http::IResponse& res)
{
    std::cout << "[NotFoundHandler] " << req.getMethod() << " " << req.getPath()
              << " from " << req.getIp() << std::endl;

    json response;
    response["error"] = "Not found";
    response["method"] = req.getMethod();
    response["path"] = req.getPath();

    // Путь приходит от клиента как есть и может не быть валидным UTF-8
    res.setResult(404, "application/json",
                  response.dump(-1, ' ', false, json::error_handler_t::replace));
}

} // namespace greeting::adapters::primary

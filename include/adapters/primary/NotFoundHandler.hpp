#pragma once

#include "http/IHttpHandler.hpp"

namespace greeting::adapters::primary {

/**
 * @brief Ответ для любой пары method/path без маршрута
 *
 * Response (404 Not Found):
 * {"error": "Not found", "method": "POST", "path": "/"}
 */
class NotFoundHandler : public http::IHttpHandler
{
public:
    void handle(http::IRequest& req, http::IResponse& res) override;
};

} // namespace greeting::adapters::primary

#pragma once

#include "http/IHttpHandler.hpp"
#include "settings/IGreetingSettings.hpp"

#include <memory>
#include <string>

namespace greeting::adapters::primary {

/**
 * @class GreetingHandler
 * @brief Обработчик корневого маршрута
 *
 * Endpoint: GET /
 *
 * Response (200 OK, text/plain; charset=utf-8):
 * Hello from ECS deployed via Azure DevOps 🚀
 *
 * Заголовки, тело и query string запроса игнорируются, ответ всегда один и тот же.
 */
class GreetingHandler : public http::IHttpHandler
{
public:
    explicit GreetingHandler(std::shared_ptr<settings::IGreetingSettings> settings);
    ~GreetingHandler() override = default;

    void handle(http::IRequest& req, http::IResponse& res) override;

private:
    const std::string message_;
};

} // namespace greeting::adapters::primary

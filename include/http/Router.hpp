#pragma once

#include "http/IHttpHandler.hpp"

#include <map>
#include <memory>
#include <string>

namespace greeting::http {

using HandlerMap = std::map<std::string, std::shared_ptr<IHttpHandler>>;

/**
 * @class Router
 * @brief Таблица маршрутов "METHOD path" -> handler
 *
 * Порядок поиска:
 * 1. точный ключ ("GET /health")
 * 2. для HEAD ключ с GET, тело ответа затем отбрасывается,
 *    а Content-Length сохраняется
 * 3. fallback handler (404)
 *
 * После создания таблица не меняется, поэтому dispatch() безопасно вызывать
 * из нескольких потоков без блокировок.
 */
class Router
{
public:
    Router(HandlerMap handlers, std::shared_ptr<IHttpHandler> fallback);

    /**
     * @brief Ключ маршрута в формате "METHOD path"
     */
    static std::string getHandlerKey(const std::string& method, const std::string& path);

    /**
     * @brief Найти handler и обработать запрос
     *
     * Исключение из handler превращается в 500 и не выходит наружу.
     */
    void dispatch(IRequest& req, IResponse& res) const;

    std::size_t size() const { return handlers_.size(); }

private:
    std::shared_ptr<IHttpHandler> find(const std::string& method, const std::string& path) const;

    HandlerMap handlers_;
    std::shared_ptr<IHttpHandler> fallback_;
};

} // namespace greeting::http

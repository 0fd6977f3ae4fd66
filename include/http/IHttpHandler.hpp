#pragma once

#include "http/IRequest.hpp"
#include "http/IResponse.hpp"

namespace greeting::http {

/**
 * @brief Обработчик одного маршрута
 *
 * Реализации вызываются из нескольких I/O потоков одновременно и не должны
 * менять собственное состояние в handle().
 */
class IHttpHandler
{
public:
    virtual ~IHttpHandler() = default;

    virtual void handle(IRequest& req, IResponse& res) = 0;
};

} // namespace greeting::http

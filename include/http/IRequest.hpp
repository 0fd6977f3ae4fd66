#pragma once

#include <cstdint>
#include <string>

namespace greeting::http {

/**
 * @brief Входящий HTTP запрос
 *
 * Абстракция над транспортом: handlers работают только с этим интерфейсом,
 * поэтому в тестах вместо Boost.Beast подставляется SimpleRequest.
 */
class IRequest
{
public:
    virtual ~IRequest() = default;

    virtual std::string getMethod() const = 0;

    /**
     * @brief Путь без query string ("/", "/health")
     */
    virtual std::string getPath() const = 0;

    /**
     * @brief Значение заголовка или пустая строка, если заголовка нет
     */
    virtual std::string getHeader(const std::string& name) const = 0;

    virtual std::string getBody() const = 0;

    virtual std::string getIp() const = 0;
    virtual uint16_t getPort() const = 0;
};

} // namespace greeting::http

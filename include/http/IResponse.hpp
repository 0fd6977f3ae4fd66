#pragma once

#include <map>
#include <string>

namespace greeting::http {

/**
 * @brief Исходящий HTTP ответ
 */
class IResponse
{
public:
    virtual ~IResponse() = default;

    virtual void setStatus(int status) = 0;
    virtual void setHeader(const std::string& name, const std::string& value) = 0;
    virtual void setBody(const std::string& body) = 0;

    virtual int getStatus() const = 0;
    virtual std::string getHeader(const std::string& name) const = 0;
    virtual std::string getBody() const = 0;

    /**
     * @brief Установить статус, Content-Type и тело одним вызовом
     */
    void setResult(int status, const std::string& contentType, const std::string& body)
    {
        setStatus(status);
        setHeader("Content-Type", contentType);
        setBody(body);
    }
};

} // namespace greeting::http

#pragma once

#include "http/IRequest.hpp"
#include "http/Target.hpp"

#include <map>
#include <string>
#include <utility>

namespace greeting::http {

/**
 * @brief In-memory реализация IRequest для тестов handlers
 *
 * @example
 * ```cpp
 * SimpleRequest req("GET", "/?utm_source=lb", "", "127.0.0.1", 3000);
 * ```
 */
class SimpleRequest : public IRequest
{
public:
    SimpleRequest(const std::string& method,
                  const std::string& target,
                  const std::string& body,
                  const std::string& ip,
                  uint16_t port,
                  std::map<std::string, std::string> headers = {})
        : method_(method)
        , path_(targetPath(target))
        , body_(body)
        , ip_(ip)
        , port_(port)
        , headers_(std::move(headers))
    {
    }

    std::string getMethod() const override { return method_; }
    std::string getPath() const override { return path_; }
    std::string getBody() const override { return body_; }
    std::string getIp() const override { return ip_; }
    uint16_t getPort() const override { return port_; }

    std::string getHeader(const std::string& name) const override
    {
        auto it = headers_.find(name);
        return it != headers_.end() ? it->second : std::string();
    }

private:
    std::string method_;
    std::string path_;
    std::string body_;
    std::string ip_;
    uint16_t port_;
    std::map<std::string, std::string> headers_;
};

} // namespace greeting::http

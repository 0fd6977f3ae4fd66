#pragma once

#include "http/IResponse.hpp"

#include <map>
#include <string>

namespace greeting::http {

/**
 * @brief In-memory реализация IResponse для тестов handlers
 */
class SimpleResponse : public IResponse
{
public:
    void setStatus(int status) override { status_ = status; }
    void setHeader(const std::string& name, const std::string& value) override { headers_[name] = value; }
    void setBody(const std::string& body) override { body_ = body; }

    int getStatus() const override { return status_; }
    std::string getBody() const override { return body_; }

    std::string getHeader(const std::string& name) const override
    {
        auto it = headers_.find(name);
        return it != headers_.end() ? it->second : std::string();
    }

    const std::map<std::string, std::string>& getHeaders() const { return headers_; }

private:
    int status_ = 200;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace greeting::http

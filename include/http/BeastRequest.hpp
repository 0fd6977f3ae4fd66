#pragma once

#include "http/IRequest.hpp"
#include "http/IResponse.hpp"
#include "http/Target.hpp"

#include <boost/beast/http.hpp>

namespace greeting::http {

namespace bhttp = boost::beast::http;

/**
 * @brief IRequest поверх boost::beast::http::request
 *
 * Не владеет запросом: живёт не дольше HttpSession, которая его прочитала.
 */
class BeastRequest : public IRequest
{
public:
    BeastRequest(const bhttp::request<bhttp::string_body>& request,
                 std::string ip,
                 uint16_t port);

    std::string getMethod() const override;
    std::string getPath() const override;
    std::string getHeader(const std::string& name) const override;
    std::string getBody() const override;
    std::string getIp() const override;
    uint16_t getPort() const override;

private:
    const bhttp::request<bhttp::string_body>& request_;
    std::string path_;
    std::string ip_;
    uint16_t port_;
};

/**
 * @brief IResponse поверх boost::beast::http::response
 */
class BeastResponse : public IResponse
{
public:
    explicit BeastResponse(bhttp::response<bhttp::string_body>& response);

    void setStatus(int status) override;
    void setHeader(const std::string& name, const std::string& value) override;
    void setBody(const std::string& body) override;

    int getStatus() const override;
    std::string getHeader(const std::string& name) const override;
    std::string getBody() const override;

private:
    bhttp::response<bhttp::string_body>& response_;
};

} // namespace greeting::http

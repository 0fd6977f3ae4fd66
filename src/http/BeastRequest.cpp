#include "http/BeastRequest.hpp"

#include <string>
#include <utility>

namespace greeting::http {

namespace {

std::string toString(boost::beast::string_view value)
{
    return std::string(value.data(), value.size());
}

} // namespace

BeastRequest::BeastRequest(const bhttp::request<bhttp::string_body>& request,
                           std::string ip,
                           uint16_t port)
    : request_(request)
    , path_(targetPath(toString(request.target())))
    , ip_(std::move(ip))
    , port_(port)
{
}

std::string BeastRequest::getMethod() const
{
    return toString(request_.method_string());
}

std::string BeastRequest::getPath() const
{
    return path_;
}

std::string BeastRequest::getHeader(const std::string& name) const
{
    auto it = request_.find(name);
    return it != request_.end() ? toString(it->value()) : std::string();
}

std::string BeastRequest::getBody() const
{
    return request_.body();
}

std::string BeastRequest::getIp() const
{
    return ip_;
}

uint16_t BeastRequest::getPort() const
{
    return port_;
}

BeastResponse::BeastResponse(bhttp::response<bhttp::string_body>& response)
    : response_(response)
{
}

void BeastResponse::setStatus(int status)
{
    response_.result(static_cast<unsigned>(status));
}

void BeastResponse::setHeader(const std::string& name, const std::string& value)
{
    response_.set(name, value);
}

void BeastResponse::setBody(const std::string& body)
{
    response_.body() = body;
}

int BeastResponse::getStatus() const
{
    return static_cast<int>(response_.result_int());
}

std::string BeastResponse::getHeader(const std::string& name) const
{
    auto it = response_.find(name);
    return it != response_.end() ? toString(it->value()) : std::string();
}

std::string BeastResponse::getBody() const
{
    return response_.body();
}

} // namespace greeting::http

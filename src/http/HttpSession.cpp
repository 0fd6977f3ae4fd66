#include "http/HttpSession.hpp"
#include "http/BeastRequest.hpp"

#include <boost/asio/dispatch.hpp>

#include <iostream>
#include <utility>

namespace greeting::http {

namespace net = boost::asio;

HttpSession::HttpSession(tcp::socket&& socket,
                         std::shared_ptr<const Router> router,
                         std::string serverHeader)
    : stream_(std::move(socket))
    , router_(std::move(router))
    , serverHeader_(std::move(serverHeader))
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec)
    {
        remoteIp_ = endpoint.address().to_string();
        remotePort_ = endpoint.port();
    }
}

void HttpSession::run()
{
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead()
{
    request_ = {};

    // Тело запроса не ограничено: GET / принимает любой ввод
    parser_.emplace();
    parser_->body_limit(boost::none);

    bhttp::async_read(stream_, buffer_, *parser_,
                      beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t)
{
    if (ec == bhttp::error::end_of_stream)
    {
        doClose();
        return;
    }
    if (ec)
    {
        if (ec != net::error::operation_aborted && ec != net::error::connection_reset)
        {
            std::cerr << "[HttpSession] Read failed from " << remoteIp_ << ": "
                      << ec.message() << std::endl;
        }
        return;
    }

    request_ = parser_->release();
    parser_.reset();

    response_ = {};
    response_.version(request_.version());
    response_.keep_alive(request_.keep_alive());
    response_.set(bhttp::field::server, serverHeader_);

    BeastRequest req(request_, remoteIp_, remotePort_);
    BeastResponse res(response_);
    router_->dispatch(req, res);

    // Для HEAD Router уже выставил Content-Length исходного тела
    if (request_.method() != bhttp::verb::head)
    {
        response_.prepare_payload();
    }

    bhttp::async_write(stream_, response_,
                       beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                 response_.keep_alive()));
}

void HttpSession::onWrite(bool keepAlive, beast::error_code ec, std::size_t)
{
    if (ec)
    {
        std::cerr << "[HttpSession] Write failed to " << remoteIp_ << ": "
                  << ec.message() << std::endl;
        return;
    }

    if (!keepAlive)
    {
        doClose();
        return;
    }

    doRead();
}

void HttpSession::doClose()
{
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != net::error::not_connected)
    {
        std::cerr << "[HttpSession] Shutdown failed for " << remoteIp_ << ": "
                  << ec.message() << std::endl;
    }
}

} // namespace greeting::http

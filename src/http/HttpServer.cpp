#include "http/HttpServer.hpp"
#include "http/HttpSession.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace greeting::http {

namespace net = boost::asio;

HttpServer::HttpServer(std::shared_ptr<settings::IServerSettings> settings,
                       std::shared_ptr<const Router> router)
    : settings_(std::move(settings))
    , router_(std::move(router))
    , ioc_(settings_ ? static_cast<int>(settings_->getThreads()) : 1)
    , acceptor_(net::make_strand(ioc_))
{
    if (!settings_ || !router_)
    {
        throw std::invalid_argument("HttpServer requires settings and router");
    }

    serverHeader_ = settings_->getServiceName() + "/" + settings_->getVersion();
}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::listen()
{
    if (listening_.load())
    {
        throw std::logic_error("HttpServer is already bound to port " + std::to_string(getPort()));
    }

    const std::string host = settings_->getHost();
    const uint16_t port = settings_->getPort();
    const std::string where = host + ":" + std::to_string(port);

    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec)
    {
        throw std::runtime_error("Invalid listen address '" + host + "': " + ec.message());
    }

    tcp::endpoint endpoint{address, port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
    {
        throw std::runtime_error("Failed to open socket for " + where + ": " + ec.message());
    }

    // SO_REUSEADDR пропускает только TIME_WAIT, занятый порт по-прежнему даёт EADDRINUSE
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
    {
        throw std::runtime_error("Failed to set SO_REUSEADDR for " + where + ": " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec)
    {
        std::string reason = ec.message();
        acceptor_.close(ec);
        throw std::runtime_error("Failed to bind " + where + ": " + reason);
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
        std::string reason = ec.message();
        acceptor_.close(ec);
        throw std::runtime_error("Failed to listen on " + where + ": " + reason);
    }

    port_ = acceptor_.local_endpoint().port();
    listening_ = true;

    std::cout << "[HttpServer] Listening on " << host << ":" << port_.load() << std::endl;

    doAccept();
}

void HttpServer::stopOnSignals()
{
    if (signals_)
    {
        return;
    }

    signals_.emplace(ioc_, SIGINT, SIGTERM);
    signals_->async_wait([this](const beast::error_code& ec, int signal) {
        if (ec)
        {
            return;
        }
        std::cout << "[HttpServer] Received signal " << signal << ", shutting down..." << std::endl;
        stop();
    });
}

void HttpServer::run()
{
    if (!listening_.load())
    {
        throw std::logic_error("HttpServer::run() called before listen()");
    }

    const unsigned threads = settings_->getThreads();
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (unsigned i = 1; i < threads; ++i)
    {
        workers.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run();

    for (auto& worker : workers)
    {
        worker.join();
    }
}

void HttpServer::stop()
{
    ioc_.stop();
}

void HttpServer::doAccept()
{
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket)
{
    if (ec == net::error::operation_aborted)
    {
        return;
    }

    if (ec)
    {
        std::cerr << "[HttpServer] Accept failed: " << ec.message() << std::endl;
    }
    else
    {
        std::make_shared<HttpSession>(std::move(socket), router_, serverHeader_)->run();
    }

    doAccept();
}

} // namespace greeting::http

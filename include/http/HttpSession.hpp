#pragma once

#include "http/Router.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <optional>
#include <string>

namespace greeting::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * @class HttpSession
 * @brief Одно HTTP/1.1 соединение: read -> dispatch -> write, пока жив keep-alive
 *
 * Владеет собой через shared_from_this(): каждая асинхронная операция держит
 * shared_ptr, сессия уничтожается после последнего callback.
 * Сокет приходит уже привязанным к strand, поэтому callbacks одной сессии
 * не выполняются параллельно.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket&& socket,
                std::shared_ptr<const Router> router,
                std::string serverHeader);

    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void onWrite(bool keepAlive, beast::error_code ec, std::size_t bytesTransferred);
    void doClose();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    bhttp::request<bhttp::string_body> request_;
    bhttp::response<bhttp::string_body> response_;

    std::shared_ptr<const Router> router_;
    std::string serverHeader_;
    std::string remoteIp_;
    uint16_t remotePort_ = 0;
};

} // namespace greeting::http

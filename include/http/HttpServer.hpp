#pragma once

#include "http/Router.hpp"
#include "settings/IServerSettings.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace greeting::http {

/**
 * @class HttpServer
 * @brief Асинхронный HTTP сервер на Boost.Beast
 *
 * Жизненный цикл: unbound -> listen() -> bound -> run() -> accepting.
 * Обратного перехода нет: после stop() объект только разрушается.
 *
 * @code
 * HttpServer server(settings, router);
 * server.listen();   // бросает при занятом порте
 * server.run();      // блокирует до stop()
 * @endcode
 */
class HttpServer
{
public:
    HttpServer(std::shared_ptr<settings::IServerSettings> settings,
               std::shared_ptr<const Router> router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Открыть, привязать и начать слушать сокет
     * @throws std::runtime_error при ошибке bind/listen
     * @throws std::logic_error при повторном вызове
     */
    void listen();

    /**
     * @brief Остановить сервер по SIGINT/SIGTERM
     */
    void stopOnSignals();

    /**
     * @brief Крутить io_context в getThreads() потоках, включая текущий
     * @throws std::logic_error если listen() не был вызван
     */
    void run();

    /**
     * @brief Прервать run(); можно вызывать из любого потока
     */
    void stop();

    bool isListening() const { return listening_.load(); }

    /**
     * @brief Фактический порт после listen() (важно при порте 0)
     */
    uint16_t getPort() const { return port_.load(); }

private:
    void doAccept();
    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    std::shared_ptr<settings::IServerSettings> settings_;
    std::shared_ptr<const Router> router_;
    std::string serverHeader_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::optional<boost::asio::signal_set> signals_;

    std::atomic<bool> listening_{false};
    std::atomic<uint16_t> port_{0};
};

} // namespace greeting::http

#pragma once

#include "config/IEnvironment.hpp"
#include "http/HttpServer.hpp"
#include "http/Router.hpp"
#include "settings/IServerSettings.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace greeting::http {

/**
 * @class BeastApplication
 * @brief Базовый класс HTTP микросервиса (Template Method)
 *
 * run() вызывает по порядку:
 * 1. loadEnvironment() - загрузка config.json в env_
 * 2. configureInjection() - наследник заполняет serverSettings_ и handlers_
 * 3. start() - bind порта и блокирующий цикл обработки запросов
 */
class BeastApplication
{
public:
    BeastApplication();
    virtual ~BeastApplication();

    BeastApplication(const BeastApplication&) = delete;
    BeastApplication& operator=(const BeastApplication&) = delete;

    /**
     * @brief Запустить приложение; возвращается после stop() или сигнала
     * @throws std::exception при ошибке конфигурации или bind
     */
    void run(int argc, char* argv[]);

    /**
     * @brief Остановить сервер; безопасно вызывать из другого потока
     */
    void stop();

    bool isListening() const;
    uint16_t getPort() const;

protected:
    virtual void loadEnvironment(int argc, char* argv[]);
    virtual void configureInjection() = 0;
    virtual void start();

    static std::string getHandlerKey(const std::string& method, const std::string& path)
    {
        return Router::getHandlerKey(method, path);
    }

    std::shared_ptr<config::IEnvironment> env_;
    std::shared_ptr<settings::IServerSettings> serverSettings_;
    HandlerMap handlers_;
    std::shared_ptr<IHttpHandler> notFoundHandler_;

private:
    mutable std::mutex serverMutex_;
    std::shared_ptr<HttpServer> server_;
    bool stopRequested_ = false;
};

} // namespace greeting::http

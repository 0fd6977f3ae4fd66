#pragma once

#include "config/IEnvironment.hpp"
#include "settings/IServerSettings.hpp"

#include <memory>
#include <string>

namespace greeting::settings {

/**
 * @brief Настройки сервера
 *
 * Приоритет источников: переменные окружения > config.json > значения по умолчанию.
 *
 * | config.json       | ENV             | default            |
 * |-------------------|-----------------|--------------------|
 * | server.host       | SERVER_HOST     | 0.0.0.0            |
 * | server.port       | SERVER_PORT     | 3000               |
 * | server.threads    | SERVER_THREADS  | 1                  |
 * | service.name      | SERVICE_NAME    | greeting-service   |
 * | service.version   | SERVICE_VERSION | 1.0.0              |
 *
 * @throws std::invalid_argument если порт вне 0..65535 или threads < 1
 */
class ServerSettings : public IServerSettings
{
public:
    explicit ServerSettings(std::shared_ptr<config::IEnvironment> env);

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }
    unsigned getThreads() const override { return threads_; }
    std::string getServiceName() const override { return serviceName_; }
    std::string getVersion() const override { return version_; }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 3000;
    unsigned threads_ = 1;
    std::string serviceName_ = "greeting-service";
    std::string version_ = "1.0.0";

    static uint16_t toPort(int64_t value, const std::string& source);
    static unsigned toThreads(int64_t value, const std::string& source);
    static int64_t parseInt(const std::string& value, const std::string& source);
};

} // namespace greeting::settings

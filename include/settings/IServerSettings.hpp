#pragma once

#include <cstdint>
#include <string>

namespace greeting::settings {

/**
 * @brief Настройки HTTP сервера
 */
class IServerSettings
{
public:
    virtual ~IServerSettings() = default;

    virtual std::string getHost() const = 0;

    /**
     * @brief Порт для bind; 0 означает эфемерный порт от ОС
     */
    virtual uint16_t getPort() const = 0;

    /**
     * @brief Количество потоков, крутящих io_context (>= 1)
     */
    virtual unsigned getThreads() const = 0;

    virtual std::string getServiceName() const = 0;
    virtual std::string getVersion() const = 0;
};

} // namespace greeting::settings

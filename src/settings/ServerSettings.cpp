#include "settings/ServerSettings.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace greeting::settings {

ServerSettings::ServerSettings(std::shared_ptr<config::IEnvironment> env)
{
    if (!env)
    {
        throw std::invalid_argument("ServerSettings requires an environment");
    }

    host_ = env->getString("server.host", host_);
    port_ = toPort(env->getInt("server.port", port_), "server.port");
    threads_ = toThreads(env->getInt("server.threads", threads_), "server.threads");
    serviceName_ = env->getString("service.name", serviceName_);
    version_ = env->getString("service.version", version_);

    if (const char* host = std::getenv("SERVER_HOST")) {
        host_ = host;
    }
    if (const char* port = std::getenv("SERVER_PORT")) {
        port_ = toPort(parseInt(port, "SERVER_PORT"), "SERVER_PORT");
    }
    if (const char* threads = std::getenv("SERVER_THREADS")) {
        threads_ = toThreads(parseInt(threads, "SERVER_THREADS"), "SERVER_THREADS");
    }
    if (const char* name = std::getenv("SERVICE_NAME")) {
        serviceName_ = name;
    }
    if (const char* version = std::getenv("SERVICE_VERSION")) {
        version_ = version;
    }

    if (host_.empty())
    {
        throw std::invalid_argument("Server host must not be empty");
    }
}

uint16_t ServerSettings::toPort(int64_t value, const std::string& source)
{
    if (value < 0 || value > std::numeric_limits<uint16_t>::max())
    {
        throw std::invalid_argument(source + ": port out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

unsigned ServerSettings::toThreads(int64_t value, const std::string& source)
{
    // Верхняя граница только от опечаток вида 10000
    if (value < 1 || value > 256)
    {
        throw std::invalid_argument(source + ": threads must be in 1..256, got " + std::to_string(value));
    }
    return static_cast<unsigned>(value);
}

int64_t ServerSettings::parseInt(const std::string& value, const std::string& source)
{
    std::size_t pos = 0;
    int64_t result = 0;
    try
    {
        result = std::stoll(value, &pos);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument(source + ": not an integer: '" + value + "'");
    }
    if (pos != value.size())
    {
        throw std::invalid_argument(source + ": not an integer: '" + value + "'");
    }
    return result;
}

} // namespace greeting::settings

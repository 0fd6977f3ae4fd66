#include "config/Environment.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace greeting::config {

namespace {

const std::string kDefaultConfigFile = "config.json";
const std::string kConfigFlag = "--config";

} // namespace

Environment::Environment(nlohmann::json config)
    : config_(std::move(config))
{
    if (!config_.is_object())
    {
        throw std::runtime_error("Configuration root must be a JSON object");
    }
}

std::shared_ptr<Environment> Environment::fromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json config;
    try
    {
        file >> config;
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }

    std::cout << "[Environment] Loaded " << path << std::endl;
    return std::make_shared<Environment>(std::move(config));
}

std::shared_ptr<Environment> Environment::fromArgs(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == kConfigFlag)
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing path after " + kConfigFlag);
            }
            return fromFile(argv[i + 1]);
        }
        if (arg.rfind(kConfigFlag + "=", 0) == 0)
        {
            return fromFile(arg.substr(kConfigFlag.size() + 1));
        }
    }

    if (std::ifstream(kDefaultConfigFile).good())
    {
        return fromFile(kDefaultConfigFile);
    }

    std::cout << "[Environment] No config file, using defaults" << std::endl;
    return std::make_shared<Environment>();
}

const nlohmann::json* Environment::find(const std::string& key) const
{
    const nlohmann::json* node = &config_;
    std::size_t start = 0;

    while (start <= key.size())
    {
        auto dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!node->is_object())
        {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end())
        {
            return nullptr;
        }
        node = &(*it);

        if (dot == std::string::npos)
        {
            break;
        }
        start = dot + 1;
    }

    return node;
}

bool Environment::has(const std::string& key) const
{
    return find(key) != nullptr;
}

std::string Environment::getString(const std::string& key, const std::string& defaultValue) const
{
    const auto* value = find(key);
    if (!value)
    {
        return defaultValue;
    }
    if (!value->is_string())
    {
        throw std::invalid_argument("Config key '" + key + "' must be a string");
    }
    return value->get<std::string>();
}

int64_t Environment::getInt(const std::string& key, int64_t defaultValue) const
{
    const auto* value = find(key);
    if (!value)
    {
        return defaultValue;
    }
    if (!value->is_number_integer())
    {
        throw std::invalid_argument("Config key '" + key + "' must be an integer");
    }
    return value->get<int64_t>();
}

} // namespace greeting::config

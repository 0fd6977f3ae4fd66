#pragma once

#include "config/IEnvironment.hpp"
#include "settings/IGreetingSettings.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

namespace greeting::settings {

/**
 * @brief Текст приветствия
 *
 * greeting.message из config.json, перекрывается GREETING_MESSAGE.
 * Пустая строка допустима.
 */
class GreetingSettings : public IGreetingSettings
{
public:
    explicit GreetingSettings(std::shared_ptr<config::IEnvironment> env)
    {
        if (!env) {
            throw std::invalid_argument("GreetingSettings requires an environment");
        }

        message_ = env->getString("greeting.message", message_);
        if (const char* message = std::getenv("GREETING_MESSAGE")) {
            message_ = message;
        }
    }

    std::string getMessage() const override { return message_; }

private:
    std::string message_ = "Hello from ECS deployed via Azure DevOps 🚀";
};

} // namespace greeting::settings

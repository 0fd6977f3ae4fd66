#pragma once

#include <string>

namespace greeting::settings {

class IGreetingSettings
{
public:
    virtual ~IGreetingSettings() = default;

    /**
     * @brief Текст ответа на GET / (UTF-8)
     */
    virtual std::string getMessage() const = 0;
};

} // namespace greeting::settings

#pragma once

#include "http/BeastApplication.hpp"

namespace greeting {

/**
 * @class GreetingApp
 * @brief Приложение Greeting Service
 *
 * Наследует BeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - регистрация handlers через Boost.DI
 * 3. start() - запуск HTTP сервера (из базового класса)
 */
class GreetingApp : public http::BeastApplication
{
public:
    GreetingApp();
    ~GreetingApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить DI контейнер и зарегистрировать handlers
     *
     * - GET /       -> GreetingHandler
     * - GET /health -> HealthHandler
     * - остальное   -> NotFoundHandler (404)
     */
    void configureInjection() override;
};

} // namespace greeting

#pragma once

#include <cstdint>
#include <string>

namespace greeting::config {

/**
 * @brief Конфигурация процесса, загруженная один раз при старте
 *
 * Ключи записываются через точку: "server.port", "greeting.message".
 * Settings-классы читают отсюда значения по умолчанию и затем
 * перекрывают их переменными окружения.
 */
class IEnvironment
{
public:
    virtual ~IEnvironment() = default;

    virtual bool has(const std::string& key) const = 0;

    /**
     * @brief Строковое значение или defaultValue, если ключа нет
     * @throws std::invalid_argument если значение не строка
     */
    virtual std::string getString(const std::string& key, const std::string& defaultValue) const = 0;

    /**
     * @brief Целое значение или defaultValue, если ключа нет
     * @throws std::invalid_argument если значение не целое число
     */
    virtual int64_t getInt(const std::string& key, int64_t defaultValue) const = 0;
};

} // namespace greeting::config

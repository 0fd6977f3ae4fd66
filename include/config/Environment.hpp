#pragma once

#include "config/IEnvironment.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace greeting::config {

/**
 * @class Environment
 * @brief IEnvironment поверх JSON документа (config.json)
 *
 * Источник выбирается в fromArgs():
 * - `--config <path>` или `--config=<path>`: файл обязан существовать
 * - иначе `config.json` в рабочей директории, если он есть
 * - иначе пустая конфигурация (все значения по умолчанию)
 */
class Environment : public IEnvironment
{
public:
    Environment() = default;
    explicit Environment(nlohmann::json config);

    /**
     * @throws std::runtime_error если файл не открывается или это не JSON объект
     */
    static std::shared_ptr<Environment> fromFile(const std::string& path);

    /**
     * @throws std::invalid_argument если после --config нет пути
     */
    static std::shared_ptr<Environment> fromArgs(int argc, char* argv[]);

    bool has(const std::string& key) const override;
    std::string getString(const std::string& key, const std::string& defaultValue) const override;
    int64_t getInt(const std::string& key, int64_t defaultValue) const override;

private:
    const nlohmann::json* find(const std::string& key) const;

    nlohmann::json config_ = nlohmann::json::object();
};

} // namespace greeting::config

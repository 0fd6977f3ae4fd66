#pragma once

#include "http/IHttpHandler.hpp"
#include "settings/IServerSettings.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <utility>

namespace greeting::adapters::primary {

/**
 * @brief Health check для target group балансировщика
 *
 * Endpoint: GET /health
 *
 * Response (200 OK):
 * {
 *   "status": "healthy",
 *   "service": "greeting-service",
 *   "version": "1.0.0"
 * }
 */
class HealthHandler : public http::IHttpHandler
{
public:
    explicit HealthHandler(std::shared_ptr<settings::IServerSettings> settings)
        : settings_(std::move(settings))
    {
        if (!settings_) {
            throw std::invalid_argument("HealthHandler requires settings");
        }
    }

    void handle(http::IRequest& req, http::IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = settings_->getServiceName();
        response["version"] = settings_->getVersion();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::IServerSettings> settings_;
};

} // namespace greeting::adapters::primary

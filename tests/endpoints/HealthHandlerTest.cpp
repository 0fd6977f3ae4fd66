#include <gtest/gtest.h>

#include "adapters/primary/HealthHandler.hpp"
#include "helpers/FakeSettings.hpp"

#include "http/SimpleRequest.hpp"
#include "http/SimpleResponse.hpp"

using greeting::adapters::primary::HealthHandler;
using greeting::http::SimpleRequest;
using greeting::http::SimpleResponse;
using greeting::tests::FakeServerSettings;

TEST(HealthHandlerTest, Get_ReturnsHealthyJson)
{
    HealthHandler handler(std::make_shared<FakeServerSettings>());
    SimpleRequest req("GET", "/health", "", "10.0.1.7", 3000);
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getHeader("Content-Type"), "application/json");

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["service"], "greeting-service");
    EXPECT_EQ(json["version"], "test");
}

TEST(HealthHandlerTest, NullSettings_Throws)
{
    EXPECT_THROW(HealthHandler(nullptr), std::invalid_argument);
}

#include "http/BeastRequest.hpp"

#include <gtest/gtest.h>

using namespace greeting::http;

// ============================================================================
// Адаптеры IRequest/IResponse поверх сообщений Boost.Beast
// ============================================================================

TEST(BeastRequestTest, ExposesMethodPathHeadersAndBody)
{
    bhttp::request<bhttp::string_body> raw{bhttp::verb::get, "/?utm_source=lb#top", 11};
    raw.set(bhttp::field::user_agent, "ELB-HealthChecker/2.0");
    raw.body() = "ignored";

    BeastRequest req(raw, "10.0.1.7", 41000);

    EXPECT_EQ(req.getMethod(), "GET");
    EXPECT_EQ(req.getPath(), "/");
    EXPECT_EQ(req.getHeader("User-Agent"), "ELB-HealthChecker/2.0");
    EXPECT_EQ(req.getHeader("X-Missing"), "");
    EXPECT_EQ(req.getBody(), "ignored");
    EXPECT_EQ(req.getIp(), "10.0.1.7");
    EXPECT_EQ(req.getPort(), 41000);
}

TEST(BeastResponseTest, SetResultWritesIntoBeastMessage)
{
    bhttp::response<bhttp::string_body> raw;
    BeastResponse res(raw);

    res.setResult(200, "text/plain; charset=utf-8", "hi");

    EXPECT_EQ(raw.result(), bhttp::status::ok);
    EXPECT_EQ(raw[bhttp::field::content_type], "text/plain; charset=utf-8");
    EXPECT_EQ(raw.body(), "hi");
    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getHeader("Content-Type"), "text/plain; charset=utf-8");
    EXPECT_EQ(res.getBody(), "hi");
}

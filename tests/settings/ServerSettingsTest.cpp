#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "settings/ServerSettings.hpp"
#include "mocks/MockEnvironment.hpp"
#include "helpers/ScopedEnv.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace greeting::settings;
using greeting::tests::MockEnvironment;
using greeting::tests::ScopedEnv;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnArg;

class ServerSettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (const char* name : {"SERVER_HOST", "SERVER_PORT", "SERVER_THREADS",
                                 "SERVICE_NAME", "SERVICE_VERSION"}) {
            ::unsetenv(name);
        }

        env = std::make_shared<NiceMock<MockEnvironment>>();
        // По умолчанию конфиг пустой: возвращаем переданный default
        ON_CALL(*env, getString(_, _)).WillByDefault(ReturnArg<1>());
        ON_CALL(*env, getInt(_, _)).WillByDefault(ReturnArg<1>());
    }

    std::shared_ptr<NiceMock<MockEnvironment>> env;
};

// ============================================================================
// Значения по умолчанию и config.json
// ============================================================================

TEST_F(ServerSettingsTest, EmptyConfig_UsesDefaults)
{
    ServerSettings settings(env);

    EXPECT_EQ(settings.getHost(), "0.0.0.0");
    EXPECT_EQ(settings.getPort(), 3000);
    EXPECT_EQ(settings.getThreads(), 1u);
    EXPECT_EQ(settings.getServiceName(), "greeting-service");
    EXPECT_EQ(settings.getVersion(), "1.0.0");
}

TEST_F(ServerSettingsTest, ConfigValues_OverrideDefaults)
{
    EXPECT_CALL(*env, getString(_, _)).Times(AnyNumber());
    EXPECT_CALL(*env, getInt(_, _)).Times(AnyNumber());
    EXPECT_CALL(*env, getString("server.host", _)).WillOnce(Return("127.0.0.1"));
    EXPECT_CALL(*env, getInt("server.port", 3000)).WillOnce(Return(8080));
    EXPECT_CALL(*env, getInt("server.threads", 1)).WillOnce(Return(4));

    ServerSettings settings(env);

    EXPECT_EQ(settings.getHost(), "127.0.0.1");
    EXPECT_EQ(settings.getPort(), 8080);
    EXPECT_EQ(settings.getThreads(), 4u);
}

TEST_F(ServerSettingsTest, PortZero_IsAllowed)
{
    ON_CALL(*env, getInt("server.port", _)).WillByDefault(Return(0));

    ServerSettings settings(env);

    EXPECT_EQ(settings.getPort(), 0);
}

TEST_F(ServerSettingsTest, ConfigPortOutOfRange_Throws)
{
    ON_CALL(*env, getInt("server.port", _)).WillByDefault(Return(70000));

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, ConfigNegativePort_Throws)
{
    ON_CALL(*env, getInt("server.port", _)).WillByDefault(Return(-1));

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, ConfigZeroThreads_Throws)
{
    ON_CALL(*env, getInt("server.threads", _)).WillByDefault(Return(0));

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, NullEnvironment_Throws)
{
    EXPECT_THROW(ServerSettings settings(nullptr), std::invalid_argument);
}

// ============================================================================
// Переменные окружения
// ============================================================================

TEST_F(ServerSettingsTest, EnvVars_OverrideConfig)
{
    ON_CALL(*env, getInt("server.port", _)).WillByDefault(Return(8080));
    ScopedEnv port("SERVER_PORT", "9090");
    ScopedEnv host("SERVER_HOST", "10.0.0.5");
    ScopedEnv threads("SERVER_THREADS", "3");
    ScopedEnv name("SERVICE_NAME", "hello");
    ScopedEnv version("SERVICE_VERSION", "2.1.0");

    ServerSettings settings(env);

    EXPECT_EQ(settings.getPort(), 9090);
    EXPECT_EQ(settings.getHost(), "10.0.0.5");
    EXPECT_EQ(settings.getThreads(), 3u);
    EXPECT_EQ(settings.getServiceName(), "hello");
    EXPECT_EQ(settings.getVersion(), "2.1.0");
}

TEST_F(ServerSettingsTest, EnvPortNotANumber_Throws)
{
    ScopedEnv port("SERVER_PORT", "abc");

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, EnvPortWithTrailingGarbage_Throws)
{
    ScopedEnv port("SERVER_PORT", "3000x");

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, EnvPortOutOfRange_Throws)
{
    ScopedEnv port("SERVER_PORT", "65536");

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

TEST_F(ServerSettingsTest, EmptyHost_Throws)
{
    ScopedEnv host("SERVER_HOST", "");

    EXPECT_THROW(ServerSettings settings(env), std::invalid_argument);
}

#include <gtest/gtest.h>

#include "config/Environment.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using greeting::config::Environment;

class EnvironmentTest : public ::testing::Test
{
protected:
    std::string writeFile(const std::string& name, const std::string& content)
    {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::shared_ptr<Environment> fromArgs(std::vector<std::string> args)
    {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Environment::fromArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// ============================================================================
// Чтение значений
// ============================================================================

TEST_F(EnvironmentTest, EmptyEnvironment_ReturnsDefaults)
{
    Environment env;

    EXPECT_FALSE(env.has("server.port"));
    EXPECT_EQ(env.getInt("server.port", 3000), 3000);
    EXPECT_EQ(env.getString("server.host", "0.0.0.0"), "0.0.0.0");
}

TEST_F(EnvironmentTest, NestedKeys_AreResolvedByDots)
{
    Environment env(nlohmann::json{
        {"server", {{"host", "127.0.0.1"}, {"port", 8081}}},
        {"greeting", {{"message", "hi"}}}
    });

    EXPECT_TRUE(env.has("server"));
    EXPECT_TRUE(env.has("server.port"));
    EXPECT_EQ(env.getInt("server.port", 0), 8081);
    EXPECT_EQ(env.getString("server.host", ""), "127.0.0.1");
    EXPECT_EQ(env.getString("greeting.message", ""), "hi");
}

TEST_F(EnvironmentTest, MissingNestedKey_ReturnsDefault)
{
    Environment env(nlohmann::json{{"server", {{"port", 8081}}}});

    EXPECT_FALSE(env.has("server.host"));
    EXPECT_FALSE(env.has("server.port.value"));
    EXPECT_EQ(env.getString("server.host", "fallback"), "fallback");
}

TEST_F(EnvironmentTest, WrongType_Throws)
{
    Environment env(nlohmann::json{{"server", {{"port", "3000"}, {"host", 1}}}});

    EXPECT_THROW(env.getInt("server.port", 0), std::invalid_argument);
    EXPECT_THROW(env.getString("server.host", ""), std::invalid_argument);
}

TEST_F(EnvironmentTest, NonObjectRoot_Throws)
{
    EXPECT_THROW(Environment(nlohmann::json::array({1, 2})), std::runtime_error);
}

// ============================================================================
// Загрузка из файла
// ============================================================================

TEST_F(EnvironmentTest, FromFile_LoadsJson)
{
    auto path = writeFile("env_valid.json", R"({"server": {"port": 4000}})");

    auto env = Environment::fromFile(path);

    EXPECT_EQ(env->getInt("server.port", 0), 4000);
}

TEST_F(EnvironmentTest, FromFile_MissingFile_Throws)
{
    EXPECT_THROW(Environment::fromFile(::testing::TempDir() + "does_not_exist.json"),
                 std::runtime_error);
}

TEST_F(EnvironmentTest, FromFile_InvalidJson_Throws)
{
    auto path = writeFile("env_invalid.json", "{ not json");

    EXPECT_THROW(Environment::fromFile(path), std::runtime_error);
}

TEST_F(EnvironmentTest, FromArgs_ConfigFlagWithSeparateValue)
{
    auto path = writeFile("env_args.json", R"({"greeting": {"message": "from args"}})");

    auto env = fromArgs({"greeting_service", "--config", path});

    EXPECT_EQ(env->getString("greeting.message", ""), "from args");
}

TEST_F(EnvironmentTest, FromArgs_ConfigFlagWithEquals)
{
    auto path = writeFile("env_args_eq.json", R"({"server": {"threads": 4}})");

    auto env = fromArgs({"greeting_service", "--config=" + path});

    EXPECT_EQ(env->getInt("server.threads", 1), 4);
}

TEST_F(EnvironmentTest, FromArgs_ConfigFlagWithoutValue_Throws)
{
    EXPECT_THROW(fromArgs({"greeting_service", "--config"}), std::invalid_argument);
}

TEST_F(EnvironmentTest, FromArgs_ConfigFileMissing_Throws)
{
    EXPECT_THROW(fromArgs({"greeting_service", "--config", ::testing::TempDir() + "nope.json"}),
                 std::runtime_error);
}

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "test_support.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

using Triage::Utils::ConfigLoader;

class ConfigLoaderTest : public TriageTest::QuietLogTest
{
};

TEST_F(ConfigLoaderTest, ParsesKeyValueLines)
{
    std::istringstream in(
        "# triage settings\n"
        "; alternate comment\n"
        "\n"
        "default_limit = 30\r\n"
        "  log_level=debug  \n"
        "pretty_json = yes\n"
        "no equals sign here\n"
        "default_limit = 40\n");

    ConfigLoader config;
    config.loadFromStream(in);

    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config.getIntOr("default_limit", 0), 40);
    EXPECT_EQ(config.getStringOr("log_level", "info"), "debug");
    EXPECT_TRUE(config.getBoolOr("pretty_json", false));
    EXPECT_FALSE(config.hasKey("no equals sign here"));
}

TEST_F(ConfigLoaderTest, TypedGettersFallBack)
{
    ConfigLoader config;
    config.set("limit", "twenty");
    config.set("flag", "maybe");

    EXPECT_FALSE(config.getInt("limit").has_value());
    EXPECT_EQ(config.getIntOr("limit", 20), 20);
    EXPECT_EQ(config.getIntOr("missing", 7), 7);
    EXPECT_FALSE(config.getBool("flag").has_value());
    EXPECT_TRUE(config.getBoolOr("flag", true));
    EXPECT_EQ(config.getStringOr("missing", "fallback"), "fallback");
}

TEST_F(ConfigLoaderTest, MissingFileKeepsValues)
{
    ConfigLoader config;
    config.set("default_limit", "12");

    EXPECT_FALSE(config.loadFromFile("/nonexistent/triage.conf"));
    EXPECT_EQ(config.getIntOr("default_limit", 0), 12);
}

TEST_F(ConfigLoaderTest, LoadsFromFile)
{
    const std::string path = ::testing::TempDir() + "build_triage_config_test.conf";
    {
        std::ofstream out(path);
        out << "summary_message_limit = 80\n";
    }

    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.getIntOr("summary_message_limit", 100), 80);
    std::remove(path.c_str());
}

TEST(LoggerTest, ParseLogLevel)
{
    using Triage::Utils::LogLevel;
    EXPECT_EQ(Triage::Utils::parseLogLevel("debug").value_or(LogLevel::CRITICAL), LogLevel::DEBUG);
    EXPECT_EQ(Triage::Utils::parseLogLevel(" Warning ").value_or(LogLevel::CRITICAL), LogLevel::WARN);
    EXPECT_FALSE(Triage::Utils::parseLogLevel("loud").has_value());
}

TEST(LoggerTest, FiltersByLevelAndFormatsLines)
{
    auto &logger = Triage::Utils::getLogger();
    const auto previous = logger.level();

    std::ostringstream sink;
    logger.setConsole(&sink);
    logger.setLevel(Triage::Utils::LogLevel::WARN);

    logger.info("hidden");
    logger.warn("shown");

    logger.setConsole(&std::cerr);
    logger.setLevel(previous);

    const std::string text = sink.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("] [WARN] shown\n"), std::string::npos);
    EXPECT_EQ(text.front(), '[');
}

#include <gtest/gtest.h>
#include "utils/config.h"
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace qkdsim::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().reset();
        path = "/tmp/qkdsim_config_test_" + std::to_string(::getpid()) + ".conf";
    }

    void TearDown() override {
        Config::instance().reset();
        std::remove(path.c_str());
    }

    void writeFile(const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    std::string path;
};

TEST_F(ConfigTest, DefaultsAreLoaded) {
    auto& config = Config::instance();
    EXPECT_EQ(config.getInt64("protocol.rounds"), 8);
    EXPECT_EQ(config.getString("protocol.oracle"), "ideal");
    EXPECT_FALSE(config.getBool("protocol.batch_oracle", true));
    EXPECT_FALSE(config.has("protocol.seed"));
    EXPECT_EQ(config.getString("log.level"), "warn");
    EXPECT_FALSE(config.isTuiEnabled());

    ProtocolConfig protocol = config.getProtocolConfig();
    EXPECT_EQ(protocol.rounds, 8u);
    EXPECT_FALSE(protocol.seeded);

    RetryConfig retry = config.getRetryConfig();
    EXPECT_EQ(retry.maxAttempts, 1u);
    EXPECT_EQ(retry.roundGrowth, 2u);

    LoggingConfig logging = config.getLoggingConfig();
    EXPECT_EQ(logging.level, "warn");
    EXPECT_TRUE(logging.console);
    EXPECT_FALSE(logging.allowSensitive);
    EXPECT_EQ(logging.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(logging.maxFiles, 5u);
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    writeFile("# comment\n\n"
              "  protocol.rounds = 256 \n"
              "protocol.oracle=circuit\n"
              "protocol.seed=16\n"
              "retry.max_attempts=3\n"
              "log.level=debug\n"
              "log.max_files=2\n"
              "ui.tui=yes\n"
              "not a setting\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));

    ProtocolConfig protocol = config.getProtocolConfig();
    EXPECT_EQ(protocol.rounds, 256u);
    EXPECT_EQ(protocol.oracle, "circuit");
    EXPECT_TRUE(protocol.seeded);
    EXPECT_EQ(protocol.seed, 16u);
    EXPECT_EQ(config.getRetryConfig().maxAttempts, 3u);
    EXPECT_EQ(config.getLoggingConfig().level, "debug");
    EXPECT_EQ(config.getLoggingConfig().maxFiles, 2u);
    EXPECT_TRUE(config.isTuiEnabled());
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(Config::instance().load("/nonexistent/qkdsim.conf"));
}

TEST_F(ConfigTest, SaveAndReloadPreservesValues) {
    auto& config = Config::instance();
    config.set("protocol.rounds", 1000);
    config.set("protocol.oracle", "circuit");
    config.set("protocol.seed", static_cast<uint64_t>(77));
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_FALSE(config.has("protocol.seed"));
    ASSERT_TRUE(config.load(path));

    ProtocolConfig loaded = config.getProtocolConfig();
    EXPECT_EQ(loaded.rounds, 1000u);
    EXPECT_EQ(loaded.oracle, "circuit");
    EXPECT_TRUE(loaded.seeded);
    EXPECT_EQ(loaded.seed, 77u);

    std::ifstream in(path);
    std::string first;
    std::getline(in, first);
    EXPECT_EQ(first, "# QKDSim Configuration");
}

TEST_F(ConfigTest, EmptySeedMeansUnseeded) {
    auto& config = Config::instance();
    config.set("protocol.seed", "");
    EXPECT_FALSE(config.getProtocolConfig().seeded);
    EXPECT_TRUE(config.isUnsigned("protocol.seed"));
}

TEST_F(ConfigTest, NumbersAreParsedStrictly) {
    auto& config = Config::instance();
    config.set("protocol.rounds", "5billion");
    config.set("protocol.seed", "banana");
    config.set("retry.max_attempts", "-2");
    config.set("retry.round_growth", "010");
    config.set("log.max_files", "0x10");

    EXPECT_EQ(config.getInt64("protocol.rounds", 8), 8);
    EXPECT_FALSE(config.isUnsigned("protocol.rounds"));
    EXPECT_EQ(config.getUInt64("protocol.seed", 9), 9u);
    EXPECT_FALSE(config.isUnsigned("protocol.seed"));
    EXPECT_FALSE(config.isUnsigned("retry.max_attempts"));
    EXPECT_EQ(config.getRetryConfig().maxAttempts, 0u);

    // decimal, so a leading zero does not switch to octal
    EXPECT_TRUE(config.isUnsigned("retry.round_growth"));
    EXPECT_EQ(config.getRetryConfig().roundGrowth, 10u);
    EXPECT_FALSE(config.isUnsigned("log.max_files"));

    config.set("protocol.seed", "99999999999999999999999");
    EXPECT_FALSE(config.isUnsigned("protocol.seed"));
    EXPECT_TRUE(config.isUnsigned("protocol.unset_key"));
}

TEST_F(ConfigTest, BooleansAreParsedStrictly) {
    auto& config = Config::instance();
    config.set("log.console", "off");
    EXPECT_TRUE(config.isBool("log.console"));
    EXPECT_FALSE(config.getBool("log.console", true));

    config.set("log.console", "sometimes");
    EXPECT_FALSE(config.isBool("log.console"));
    EXPECT_TRUE(config.getBool("log.console", true));
}

TEST_F(ConfigTest, ParseUnsignedIsDecimal) {
    uint64_t value = 0;
    EXPECT_TRUE(Config::parseUnsigned("010", value));
    EXPECT_EQ(value, 10u);
    EXPECT_TRUE(Config::parseUnsigned("18446744073709551615", value));
    EXPECT_EQ(value, UINT64_MAX);

    value = 7;
    for (const char* text : {"", "0x10", "-1", "+5", " 5", "5 ", "12abc", "18446744073709551616"}) {
        EXPECT_FALSE(Config::parseUnsigned(text, value)) << "'" << text << "'";
    }
    EXPECT_EQ(value, 7u);
}

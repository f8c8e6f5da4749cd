// RtmpFrame - RTMP message framing library
// Tests for Configuration Manager
//
// Tests cover:
// - Defaults when no configuration is supplied
// - JSON documents from strings and files
// - Field-level validation errors
// - All-or-nothing loading
// - RTMPFRAME_* environment overrides, including malformed values
// - JSON dump of the effective configuration

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "rtmpframe/core/config_manager.hpp"

namespace rtmpframe {
namespace core {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : createdFiles_) {
            std::remove(path.c_str());
        }
        for (const auto& name : setEnvVars_) {
            unsetenv(name.c_str());
        }
    }

    std::string writeConfigFile(const std::string& name, const std::string& content) {
        const char* tmpdir = std::getenv("TMPDIR");
        std::string path = std::string(tmpdir != nullptr ? tmpdir : "/tmp") +
            "/rtmpframe_" + std::to_string(getpid()) + "_" + name;
        std::ofstream file(path);
        file << content;
        createdFiles_.push_back(path);
        return path;
    }

    void setEnv(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        setEnvVars_.push_back(name);
    }

    ConfigManager manager_;
    std::vector<std::string> createdFiles_;
    std::vector<std::string> setEnvVars_;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigManagerTest, DefaultsMatchProtocolDefaults) {
    Configuration config = manager_.getConfig();

    EXPECT_EQ(config.protocol.outChunkSize, 128u);
    EXPECT_EQ(config.protocol.windowAckSize, 2500000u);
    EXPECT_TRUE(config.protocol.complexHandshake);
    EXPECT_EQ(config.protocol.maxMessageSize, 0xFFFFFFu);
    EXPECT_EQ(config.logging.level, pal::LogLevel::Info);
    EXPECT_FALSE(config.logging.json);
    EXPECT_TRUE(manager_.validate().isSuccess());
}

// =============================================================================
// JSON Loading
// =============================================================================

TEST_F(ConfigManagerTest, LoadsAllSectionsFromJson) {
    auto result = manager_.loadFromJsonString(R"({
        "protocol": {
            "outChunkSize": 4096,
            "windowAckSize": 5000000,
            "complexHandshake": false,
            "maxMessageSize": 1048576
        },
        "logging": { "level": "debug", "json": true, "console": false, "syslog": true }
    })");

    ASSERT_TRUE(result.isSuccess()) << result.error().message;
    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.protocol.outChunkSize, 4096u);
    EXPECT_EQ(config.protocol.windowAckSize, 5000000u);
    EXPECT_FALSE(config.protocol.complexHandshake);
    EXPECT_EQ(config.protocol.maxMessageSize, 1048576u);
    EXPECT_EQ(config.logging.level, pal::LogLevel::Debug);
    EXPECT_TRUE(config.logging.json);
    EXPECT_FALSE(config.logging.console);
    EXPECT_TRUE(config.logging.syslog);
}

TEST_F(ConfigManagerTest, MissingKeysKeepDefaults) {
    auto result = manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 60000 } })");

    ASSERT_TRUE(result.isSuccess());
    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.protocol.outChunkSize, 60000u);
    EXPECT_EQ(config.protocol.windowAckSize, 2500000u);
}

TEST_F(ConfigManagerTest, UnknownKeysAreIgnored) {
    auto result = manager_.loadFromJsonString(R"({ "server": { "port": 1935 }, "protocol": {} })");

    EXPECT_TRUE(result.isSuccess());
}

TEST_F(ConfigManagerTest, MalformedJsonIsParseError) {
    auto result = manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 4096 )");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
}

TEST_F(ConfigManagerTest, OutChunkSizeOutOfRangeNamesField) {
    auto result = manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 64 } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(result.error().field, "protocol.outChunkSize");
}

TEST_F(ConfigManagerTest, MaxMessageSizeAboveLengthFieldIsRejected) {
    auto result = manager_.loadFromJsonString(R"({ "protocol": { "maxMessageSize": 16777216 } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "protocol.maxMessageSize");
}

TEST_F(ConfigManagerTest, WrongTypeNamesField) {
    auto result = manager_.loadFromJsonString(R"({ "protocol": { "complexHandshake": "yes" } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "protocol.complexHandshake");
}

TEST_F(ConfigManagerTest, UnknownLogLevelIsRejected) {
    auto result = manager_.loadFromJsonString(R"({ "logging": { "level": "chatty" } })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.level");
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousConfiguration) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 4096 } })").isSuccess());

    auto result = manager_.loadFromJsonString(
        R"({ "protocol": { "windowAckSize": 1000, "outChunkSize": 1 } })");

    ASSERT_TRUE(result.isError());
    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.protocol.outChunkSize, 4096u);
    EXPECT_EQ(config.protocol.windowAckSize, 2500000u);
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    std::string path = writeConfigFile("config.json",
        R"({ "protocol": { "windowAckSize": 0 } })");

    auto result = manager_.loadFromFile(path);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(manager_.getConfig().protocol.windowAckSize, 0u);
}

TEST_F(ConfigManagerTest, MissingFileIsFileNotFound) {
    auto result = manager_.loadFromFile("/nonexistent/rtmpframe/config.json");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, LoadDefaultsResetsValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 4096 } })").isSuccess());

    ASSERT_TRUE(manager_.loadDefaults().isSuccess());

    EXPECT_EQ(manager_.getConfig().protocol.outChunkSize, 128u);
}

// =============================================================================
// Environment Overrides
// =============================================================================

TEST_F(ConfigManagerTest, EnvironmentOverridesApply) {
    setEnv("RTMPFRAME_OUT_CHUNK_SIZE", "8192");
    setEnv("RTMPFRAME_WINDOW_ACK_SIZE", "1000000");
    setEnv("RTMPFRAME_COMPLEX_HANDSHAKE", "false");
    setEnv("RTMPFRAME_LOG_LEVEL", "ERROR");
    setEnv("RTMPFRAME_LOG_JSON", "1");

    manager_.applyEnvironmentOverrides();

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.protocol.outChunkSize, 8192u);
    EXPECT_EQ(config.protocol.windowAckSize, 1000000u);
    EXPECT_FALSE(config.protocol.complexHandshake);
    EXPECT_EQ(config.logging.level, pal::LogLevel::Error);
    EXPECT_TRUE(config.logging.json);
}

TEST_F(ConfigManagerTest, MalformedEnvironmentValuesAreSkipped) {
    setEnv("RTMPFRAME_OUT_CHUNK_SIZE", "100000");
    setEnv("RTMPFRAME_WINDOW_ACK_SIZE", "-5");
    setEnv("RTMPFRAME_COMPLEX_HANDSHAKE", "maybe");

    manager_.applyEnvironmentOverrides();

    Configuration config = manager_.getConfig();
    EXPECT_EQ(config.protocol.outChunkSize, 128u);
    EXPECT_EQ(config.protocol.windowAckSize, 2500000u);
    EXPECT_TRUE(config.protocol.complexHandshake);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(manager_.loadFromJsonString(R"({ "protocol": { "outChunkSize": 4096 } })").isSuccess());
    setEnv("RTMPFRAME_OUT_CHUNK_SIZE", "256");

    manager_.applyEnvironmentOverrides();

    EXPECT_EQ(manager_.getConfig().protocol.outChunkSize, 256u);
}

// =============================================================================
// Dump
// =============================================================================

TEST_F(ConfigManagerTest, DumpedConfigLoadsBack) {
    ASSERT_TRUE(manager_.loadFromJsonString(
        R"({ "protocol": { "outChunkSize": 1024 }, "logging": { "level": "warning" } })").isSuccess());

    std::string dumped = manager_.dumpConfig();
    ConfigManager other;
    auto result = other.loadFromJsonString(dumped);

    ASSERT_TRUE(result.isSuccess()) << result.error().message;
    EXPECT_EQ(other.getConfig().protocol.outChunkSize, 1024u);
    EXPECT_EQ(other.getConfig().logging.level, pal::LogLevel::Warning);
}

} // namespace test
} // namespace core
} // namespace rtmpframe

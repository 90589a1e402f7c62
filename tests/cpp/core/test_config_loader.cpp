/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the JSON config loader and environment overrides
 */

#include "core/config_loader.h"
#include "support/scoped_env.h"
#include "support/temp_dir.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace fs = std::filesystem;
using namespace ad_silencer::core;
using ad_silencer::logging::LogLevel;
using ad_silencer::testing::ScopedEnv;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        tempDir = ad_silencer::testing::makeTestTempDir("config_loader");
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AppConfig config;
    EXPECT_FALSE(loadAppConfig("/nonexistent/path/config.json", config, false));
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    AppConfig config;
    config.playerName = "stale";
    loadAppConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.playerName, "spotify");
    EXPECT_EQ(config.mixerAppName, "Spotify");
    EXPECT_EQ(config.fillerDir, "");
    EXPECT_FALSE(config.fillerMode());
    EXPECT_EQ(config.settleDelayMs, 500);
    EXPECT_EQ(config.playbackDevice, "default");
    EXPECT_EQ(config.lockName, "ad_silencer");
    EXPECT_EQ(config.pactlPath, "pactl");
    EXPECT_EQ(config.logging.level, LogLevel::Info);
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");
    AppConfig config;
    EXPECT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playerName, "spotify");
}

TEST_F(ConfigLoaderTest, LoadOverridesAllKeys) {
    writeConfig(R"({
        "playerName": "ncspot",
        "mixerAppName": "ncspot",
        "fillerDir": "/srv/fillers",
        "settleDelayMs": 250,
        "playbackDevice": "hw:1,0",
        "lockName": "ad_silencer_test",
        "pactlPath": "/usr/local/bin/pactl",
        "logging": {"level": "debug", "filePath": "/tmp/ad.log", "maxBackups": 5,
                    "coloredOutput": false}
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));

    EXPECT_EQ(config.playerName, "ncspot");
    EXPECT_EQ(config.mixerAppName, "ncspot");
    EXPECT_EQ(config.fillerDir, "/srv/fillers");
    EXPECT_TRUE(config.fillerMode());
    EXPECT_EQ(config.settleDelayMs, 250);
    EXPECT_EQ(config.playbackDevice, "hw:1,0");
    EXPECT_EQ(config.lockName, "ad_silencer_test");
    EXPECT_EQ(config.pactlPath, "/usr/local/bin/pactl");
    EXPECT_EQ(config.logging.level, LogLevel::Debug);
    EXPECT_EQ(config.logging.filePath, "/tmp/ad.log");
    EXPECT_EQ(config.logging.maxBackups, 5u);
    EXPECT_FALSE(config.logging.coloredOutput);
}

TEST_F(ConfigLoaderTest, NegativeSettleDelayIsClamped) {
    writeConfig(R"({"settleDelayMs": -20})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.settleDelayMs, 50);
}

TEST_F(ConfigLoaderTest, ZeroSettleDelayIsRaisedToFloor) {
    writeConfig(R"({"settleDelayMs": 0})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.settleDelayMs, 50);
}

TEST_F(ConfigLoaderTest, EmptyPlayerNameFallsBackToDefault) {
    writeConfig(R"({"playerName": ""})");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playerName, "spotify");
}

TEST_F(ConfigLoaderTest, MalformedJsonFallsBackToDefaults) {
    writeConfig("{ \"playerName\": ");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playerName, "spotify");
}

TEST_F(ConfigLoaderTest, WrongTypeFallsBackToDefaults) {
    writeConfig(R"({"settleDelayMs": "soon"})");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.settleDelayMs, 500);
}

// ============================================================
// Environment overrides
// ============================================================

TEST_F(ConfigLoaderTest, DebugEnvLowersLogLevel) {
    ScopedEnv debug(ENV_DEBUG, "1");
    AppConfig config;
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.logging.level, LogLevel::Debug);
}

TEST_F(ConfigLoaderTest, FalsyDebugEnvKeepsLevel) {
    ScopedEnv debug(ENV_DEBUG, "0");
    AppConfig config;
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.logging.level, LogLevel::Info);
}

TEST_F(ConfigLoaderTest, PlayerAndFillerEnvOverrideFile) {
    ScopedEnv player(ENV_PLAYER, "vlc");
    ScopedEnv filler(ENV_FILLER_DIR, "/tmp/fillers");
    ScopedEnv debug(ENV_DEBUG, nullptr);
    AppConfig config;
    config.playerName = "from_file";

    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.playerName, "vlc");
    EXPECT_EQ(config.fillerDir, "/tmp/fillers");
}

TEST(ConfigTruthy, RecognizesCommonSpellings) {
    EXPECT_TRUE(isTruthy("1"));
    EXPECT_TRUE(isTruthy("TRUE"));
    EXPECT_TRUE(isTruthy("yes"));
    EXPECT_TRUE(isTruthy("On"));
    EXPECT_FALSE(isTruthy("0"));
    EXPECT_FALSE(isTruthy(""));
    EXPECT_FALSE(isTruthy("debug"));
}

// ============================================================
// Filler directory validation
// ============================================================

TEST_F(ConfigLoaderTest, ValidateFillerDir) {
    EXPECT_EQ(validateFillerDir(tempDir), ErrorCode::OK);
    EXPECT_EQ(validateFillerDir(tempDir / "missing"), ErrorCode::VALIDATION_FILE_NOT_FOUND);

    writeConfig("{}");
    EXPECT_EQ(validateFillerDir(testConfigPath), ErrorCode::VALIDATION_NOT_A_DIRECTORY);
}

#include "config_manager.h"
#include "errors.h"
#include "json_store.h"
#include "logging.h"
#include "test_helpers.h"
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using namespace testing_support;

TEST(ConfigManagerTest, MissingFileMeansDefaults)
{
    TempDir dir("lr-config-defaults");
    ConfigManager config((dir.path / "absent.json").string());

    EXPECT_EQ(config.getHome(), "/var/lib/iotronic");
    EXPECT_EQ(config.getLogLevel(), "info");
    EXPECT_EQ(config.getLogFile(), "");
    EXPECT_TRUE(config.skipCertVerify());
    EXPECT_EQ(config.getCaFile(), "");
    EXPECT_EQ(config.getBoardSettingsPath(), "/var/lib/iotronic/settings.json");
}

TEST(ConfigManagerTest, ValuesAreReadFromFile)
{
    TempDir dir("lr-config-values");
    writeJson(dir.path / "agent.json", {
        {"lightningrod", {
            {"home", "/opt/lr"},
            {"log_level", "debug"},
            {"log_file", "/var/log/lr.log"},
            {"skip_cert_verify", false},
            {"ca_file", "/etc/ssl/ca.pem"}
        }}
    });

    ConfigManager config((dir.path / "agent.json").string());

    EXPECT_EQ(config.getHome(), "/opt/lr");
    EXPECT_EQ(config.getLogLevel(), "debug");
    EXPECT_EQ(config.getLogFile(), "/var/log/lr.log");
    EXPECT_FALSE(config.skipCertVerify());
    EXPECT_EQ(config.getCaFile(), "/etc/ssl/ca.pem");
    EXPECT_EQ(config.getBoardSettingsPath(), "/opt/lr/settings.json");
}

TEST(ConfigManagerTest, MalformedFileIsConfigurationError)
{
    TempDir dir("lr-config-malformed");
    std::ofstream(dir.path / "agent.json") << "{ not json";

    EXPECT_THROW(ConfigManager((dir.path / "agent.json").string()), ConfigurationError);
}

TEST(ConfigManagerTest, NonObjectFileIsConfigurationError)
{
    TempDir dir("lr-config-array");
    std::ofstream(dir.path / "agent.json") << "[1, 2, 3]";

    EXPECT_THROW(ConfigManager((dir.path / "agent.json").string()), ConfigurationError);
}

TEST(ConfigManagerTest, BoardSettingsRoundTripThroughHome)
{
    TempDir dir("lr-config-board");
    writeJson(dir.path / "agent.json", agentConfig(dir));
    ConfigManager config((dir.path / "agent.json").string());

    nlohmann::json settings = boardSettings("registered", true, true);
    config.saveBoardSettings(settings);

    EXPECT_TRUE(std::filesystem::exists(dir.path / "home" / "settings.json"));
    EXPECT_FALSE(std::filesystem::exists(dir.path / "home" / "settings.json.tmp"));
    EXPECT_EQ(config.loadBoardSettings(), settings);
}

TEST(ConfigManagerTest, BoardSettingsWithoutIotronicSectionIsRejected)
{
    TempDir dir("lr-config-board-bad");
    writeJson(dir.path / "agent.json", agentConfig(dir));
    writeJson(dir.path / "home" / "settings.json", {{"board", nlohmann::json::object()}});
    ConfigManager config((dir.path / "agent.json").string());

    EXPECT_THROW(config.loadBoardSettings(), ConfigurationError);
}

TEST(JsonStoreTest, ReadingMissingFileIsPersistenceError)
{
    TempDir dir("lr-store-missing");
    EXPECT_THROW(readJsonFile((dir.path / "nope.json").string()), PersistenceError);
}

TEST(JsonStoreTest, WriteCreatesParentDirectories)
{
    TempDir dir("lr-store-write");
    std::string path = (dir.path / "nested" / "deeper" / "doc.json").string();

    writeJsonFile(path, {{"key", "value"}});

    EXPECT_EQ(readJsonFile(path)["key"], "value");
}

TEST(LoggingTest, OverrideWinsOverEnvironmentAndConfig)
{
    setenv("LIGHTNINGROD_LOG_LEVEL", "warn", 1);
    EXPECT_EQ(resolveLogLevel("trace", "error"), "trace");
    EXPECT_EQ(resolveLogLevel("", "error"), "warn");
    unsetenv("LIGHTNINGROD_LOG_LEVEL");

    EXPECT_EQ(resolveLogLevel("", "error"), "error");
    EXPECT_EQ(resolveLogLevel("", ""), "info");
}

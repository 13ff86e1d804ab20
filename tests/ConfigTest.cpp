#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "ClientConfig.h"
#include "ConfigUtils.h"

using ClientConfig::Configuration;
using json = nlohmann::json;

namespace {

void clearOverrides()
{
    ::unsetenv("CALL_WS_URL");
    ::unsetenv("CALL_LOG_LEVEL");
    ::unsetenv("CALL_CAPTURE_DEVICE");
    ::unsetenv("CALL_PLAYBACK_DEVICE");
}

std::string writeTempFile(const std::string& name, const std::string& contents)
{
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearOverrides(); }
    void TearDown() override { clearOverrides(); }
};

TEST_F(ConfigTest, DefaultsAreValid)
{
    Configuration config;
    std::string error;
    EXPECT_TRUE(ClientConfig::validateConfiguration(config, error)) << error;
    EXPECT_EQ(config.server.voicePath, "/ws/voice");
    EXPECT_EQ(config.server.textPath, "/ws");
    ASSERT_EQ(config.reconnect.delays.size(), 3u);
    EXPECT_EQ(config.reconnect.delays[2], std::chrono::milliseconds(12000));
    EXPECT_EQ(config.capture.sampleRate, 16000);
    EXPECT_EQ(config.capture.frameSamples, 4096u);
}

TEST_F(ConfigTest, PartialJsonKeepsDefaults)
{
    Configuration config;
    json j = json::parse(R"({
        "server": {"baseUrl": "ws://10.0.0.5:9000"},
        "reconnect": {"delaysMs": [100, 200]},
        "playback": {"volume": 0.5, "codec": "opus"}
    })");
    ASSERT_TRUE(ClientConfig::loadFromJson(j, config));

    EXPECT_EQ(config.server.baseUrl, "ws://10.0.0.5:9000");
    EXPECT_EQ(config.server.voicePath, "/ws/voice");
    ASSERT_EQ(config.reconnect.delays.size(), 2u);
    EXPECT_EQ(config.reconnect.delays[1], std::chrono::milliseconds(200));
    EXPECT_FLOAT_EQ(config.playback.volume, 0.5f);
    EXPECT_EQ(config.playback.codec, "opus");
    EXPECT_EQ(config.capture.frameSamples, 4096u);
}

TEST_F(ConfigTest, TypeErrorsAreRejected)
{
    Configuration config;
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse(R"({"capture": {"sampleRate": "fast"}})"), config));
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse(R"({"reconnect": {"delaysMs": ["soon"]}})"), config));
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse("[1, 2]"), config));
}

TEST_F(ConfigTest, NegativeCountsAreRejected)
{
    Configuration config;
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse(R"({"server": {"maxMessageBytes": -1}})"), config));
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse(R"({"capture": {"frameSamples": -4096}})"), config));
    EXPECT_FALSE(ClientConfig::loadFromJson(json::parse(R"({"capture": {"queueDepth": 0}})"), config));

    Configuration untouched;
    EXPECT_EQ(untouched.capture.frameSamples, 4096u);
    ASSERT_TRUE(ClientConfig::loadFromJson(json::parse(R"({"capture": {"frameSamples": 1024, "queueDepth": 8}})"),
                                           untouched));
    EXPECT_EQ(untouched.capture.frameSamples, 1024u);
    EXPECT_EQ(untouched.capture.queueDepth, 8u);

    std::string rejectedFile = writeTempFile("call-negative.json", R"({"capture": {"queueDepth": -3}})");
    Configuration fromFile;
    EXPECT_FALSE(ConfigUtils::LoadClientConfig(fromFile, rejectedFile));
}

TEST_F(ConfigTest, ValidationCatchesInconsistentValues)
{
    std::string error;

    Configuration badUrl;
    badUrl.server.baseUrl = "http://localhost:8000";
    EXPECT_FALSE(ClientConfig::validateConfiguration(badUrl, error));

    Configuration noSchedule;
    noSchedule.reconnect.delays.clear();
    EXPECT_FALSE(ClientConfig::validateConfiguration(noSchedule, error));

    Configuration zeroFrame;
    zeroFrame.capture.frameSamples = 0;
    EXPECT_FALSE(ClientConfig::validateConfiguration(zeroFrame, error));

    Configuration loud;
    loud.playback.volume = 1.5f;
    EXPECT_FALSE(ClientConfig::validateConfiguration(loud, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, SavedJsonLoadsBack)
{
    Configuration original;
    original.server.baseUrl = "ws://example:1234";
    original.reconnect.delays = {std::chrono::milliseconds(50)};
    original.capture.deviceName = "USB Mic";

    Configuration loaded;
    ASSERT_TRUE(ClientConfig::loadFromJson(ClientConfig::saveToJson(original), loaded));
    EXPECT_EQ(loaded.server.baseUrl, "ws://example:1234");
    EXPECT_EQ(loaded.reconnect.delays, original.reconnect.delays);
    EXPECT_EQ(loaded.capture.deviceName, "USB Mic");
}

TEST_F(ConfigTest, EnvironmentOverridesFile)
{
    ::setenv("CALL_WS_URL", "ws://override:1", 1);
    ::setenv("CALL_PLAYBACK_DEVICE", "Headphones", 1);

    Configuration config;
    ClientConfig::applyEnvironmentOverrides(config);
    EXPECT_EQ(config.server.baseUrl, "ws://override:1");
    EXPECT_EQ(config.playback.deviceName, "Headphones");
    EXPECT_TRUE(config.capture.deviceName.empty());
}

TEST_F(ConfigTest, MissingFileUsesDefaults)
{
    Configuration config;
    EXPECT_TRUE(ConfigUtils::LoadClientConfig(config, ::testing::TempDir() + "does-not-exist.json"));
    EXPECT_EQ(config.server.baseUrl, "ws://localhost:8000");
}

TEST_F(ConfigTest, FileIsLoadedAndValidated)
{
    Configuration config;
    std::string good = writeTempFile("call-good.json", R"({"server": {"baseUrl": "ws://file:5"}})");
    ASSERT_TRUE(ConfigUtils::LoadClientConfig(config, good));
    EXPECT_EQ(config.server.baseUrl, "ws://file:5");

    Configuration broken;
    std::string invalid = writeTempFile("call-invalid.json", "{ server: ");
    EXPECT_FALSE(ConfigUtils::LoadClientConfig(broken, invalid));

    Configuration rejected;
    std::string empty = writeTempFile("call-empty-schedule.json", R"({"reconnect": {"delaysMs": []}})");
    EXPECT_FALSE(ConfigUtils::LoadClientConfig(rejected, empty));
}

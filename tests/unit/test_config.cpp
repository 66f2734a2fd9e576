#include <gtest/gtest.h>
#include "pqshare/core/config.hpp"
#include <fstream>
#include <filesystem>

using namespace pqshare::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = (std::filesystem::temp_directory_path() / "pqshare_test_config.txt").string();
    }

    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int64.value", "8589934592");
    config.set("double.value", "0.25");
    config.set("bad.int", "12abc");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int64("int64.value"), 8589934592LL);
    EXPECT_DOUBLE_EQ(config.get_double("double.value"), 0.25);
    EXPECT_EQ(config.get_int("bad.int", 7), 7);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "transfer.ack_timeout_ms=2500\n";
    file << "network.mode = lan \n";
    file << "not a key value line\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_int("transfer.ack_timeout_ms"), 2500);
    EXPECT_EQ(config.get_string("network.mode"), "lan");
    EXPECT_FALSE(config.load_from_file(test_file + ".missing"));
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    config.clear();
    EXPECT_FALSE(config.contains("test.key1"));

    EXPECT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("test.key1"), "value1");
    EXPECT_EQ(config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, EngineSettings_Defaults) {
    auto& config = Config::instance();
    config.set_defaults();

    auto settings = EngineSettings::from_config(config);
    EXPECT_EQ(settings.ack_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(settings.max_chunk_retries, 3u);
    EXPECT_EQ(settings.max_total_chunks, 100000u);
    EXPECT_EQ(settings.kex_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(settings.kex_max_attempts, 3u);
    EXPECT_EQ(settings.rotation_interval, std::chrono::seconds(300));
    EXPECT_EQ(settings.rotation_bytes, 1ULL << 30);
    EXPECT_EQ(settings.resume_max_attempts, 3u);
    EXPECT_EQ(settings.resume_expiry, std::chrono::hours(168));
    EXPECT_EQ(settings.network_mode, NetworkMode::WIDE_AREA);
    EXPECT_EQ(settings.bitrate_mode, BitrateMode::BALANCED);
    EXPECT_EQ(settings.group_max_recipients, 10u);
}

TEST_F(ConfigTest, EngineSettings_OverridesAndClamps) {
    auto& config = Config::instance();
    config.set("network.mode", "lan");
    config.set("bitrate.mode", "aggressive");
    config.set("transfer.ack_timeout_ms", "-5");
    config.set("transfer.max_total_chunks", "500000");
    config.set("group.max_recipients", "50");
    config.set("kex.max_attempts", "5");

    auto settings = EngineSettings::from_config(config);
    EXPECT_EQ(settings.network_mode, NetworkMode::LOCAL);
    EXPECT_EQ(settings.bitrate_mode, BitrateMode::AGGRESSIVE);
    EXPECT_EQ(settings.ack_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(settings.max_total_chunks, 100000u);
    EXPECT_EQ(settings.group_max_recipients, 10u);
    EXPECT_EQ(settings.kex_max_attempts, 5u);

    config.set("kex.max_attempts", "40");
    EXPECT_EQ(EngineSettings::from_config(config).kex_max_attempts,
              static_cast<std::uint32_t>(EngineSettings::MAX_KEX_ATTEMPTS));
}

TEST_F(ConfigTest, ParseModes) {
    EXPECT_EQ(parse_network_mode("wan"), NetworkMode::WIDE_AREA);
    EXPECT_EQ(parse_network_mode("local"), NetworkMode::LOCAL);
    EXPECT_FALSE(parse_network_mode("satellite").has_value());
    EXPECT_EQ(parse_bitrate_mode("conservative"), BitrateMode::CONSERVATIVE);
    EXPECT_FALSE(parse_bitrate_mode("fast").has_value());
}

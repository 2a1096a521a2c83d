#include <gtest/gtest.h>
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/transfer/transfer_session.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

using namespace chunkrelay::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_chunkrelay.conf";
    }

    void TearDown() override {
        Config::instance().clear();
        unsetenv("CHUNKRELAY_TRANSFER_CHUNK_SIZE");
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
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("int.value", "42");
    config.set("uint64.value", "6442450944");
    config.set("string.value", "hello world");

    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_uint64("uint64.value"), 6442450944ULL);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");

    config.set("int.garbage", "twelve");
    EXPECT_EQ(config.get_int("int.garbage", 7), 7);

    config.set("int.suffixed", "64K");
    EXPECT_EQ(config.get_uint64("int.suffixed", 9), 9u);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "transfer.chunk_size=65536\n";
    file << "s3.region = eu-west-1 \n";
    file << "not a setting\n";
    file << "graph.base_url=https://graph.example.test/v1.0?x=1\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 65536u);
    EXPECT_EQ(config.get_string("s3.region"), "eu-west-1");
    EXPECT_EQ(config.get_string("graph.base_url"), "https://graph.example.test/v1.0?x=1");
    EXPECT_FALSE(config.get("not a setting").has_value());
}

TEST_F(ConfigTest, MissingFileIsReported) {
    EXPECT_FALSE(Config::instance().load_from_file("does/not/exist.conf"));
}

TEST_F(ConfigTest, EnvironmentOverridesKnownKeys) {
    auto& config = Config::instance();
    config.set_defaults();

    setenv("CHUNKRELAY_TRANSFER_CHUNK_SIZE", "4096", 1);
    config.load_from_environment();

    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 4096u);
    EXPECT_EQ(config.get_int("transfer.buffer_chunks"), 8);
}

TEST_F(ConfigTest, DefaultsDriveTransferOptions) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("retry.chunk_attempts", "7");
    config.set("retry.base_delay_ms", "250");
    config.set("transfer.session_timeout_s", "90");

    auto options = chunkrelay::transfer::TransferOptions::from_config();

    EXPECT_EQ(options.chunk_size, 1048576u);
    EXPECT_EQ(options.buffer_chunks, 8u);
    EXPECT_EQ(options.session_timeout, std::chrono::seconds(90));
    EXPECT_EQ(options.chunk_retry.max_attempts, 7u);
    EXPECT_EQ(options.chunk_retry.base_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(options.metadata_retry.max_attempts, 3u);
    EXPECT_EQ(options.metadata_retry.max_server_delay, std::chrono::seconds(120));
}

#include "suid/common/config.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>

#include <gtest/gtest.h>

namespace suid {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("suid_config_test_" +
                     std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
                     "_" + std::to_string(test_counter_++));
        std::filesystem::create_directories(test_dir_);
        config_path_ = test_dir_ / "suid.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream out(config_path_, std::ios::trunc);
        out << text;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path config_path_;
    static inline int test_counter_ = 0;
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_FALSE(config.GetHostId().has_value());
    EXPECT_EQ(config.GetHostEnvVar(), "SUID_HOST_ID");
    EXPECT_TRUE(config.GetResolveFromNetwork());
    EXPECT_EQ(config.GetDefaultGroup(), 0u);
    EXPECT_EQ(config.GetLogLevel(), "info");
}

TEST_F(ConfigTest, MissingFileIsNotFound) {
    Config config;
    absl::Status status = config.Load(test_dir_ / "absent.json");
    EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    Config saved;
    saved.SetHostId(12);
    saved.SetHostEnvVar("NODE_ORDINAL");
    saved.SetResolveFromNetwork(false);
    ASSERT_TRUE(saved.SetDefaultGroup(5).ok());
    saved.SetLogLevel("warning");
    ASSERT_TRUE(saved.Save(config_path_).ok());

    Config loaded;
    ASSERT_TRUE(loaded.Load(config_path_).ok());
    EXPECT_EQ(loaded.GetHostId(), std::optional<uint64_t>(12));
    EXPECT_EQ(loaded.GetHostEnvVar(), "NODE_ORDINAL");
    EXPECT_FALSE(loaded.GetResolveFromNetwork());
    EXPECT_EQ(loaded.GetDefaultGroup(), 5u);
    EXPECT_EQ(loaded.GetLogLevel(), "warning");
}

TEST_F(ConfigTest, SaveCreatesParentDirectories) {
    Config config;
    const auto nested = test_dir_ / "a" / "b" / "suid.json";
    ASSERT_TRUE(config.Save(nested).ok());
    EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(ConfigTest, UnsetHostIdIsWrittenAsNull) {
    Config config;
    ASSERT_TRUE(config.Save(config_path_).ok());

    std::ifstream in(config_path_);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("\"host_id\": null"), std::string::npos);

    Config loaded;
    loaded.SetHostId(3);
    ASSERT_TRUE(loaded.Load(config_path_).ok());
    EXPECT_FALSE(loaded.GetHostId().has_value());
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    WriteConfig(R"({ "host_id": 7 })");

    Config config;
    ASSERT_TRUE(config.Load(config_path_).ok());
    EXPECT_EQ(config.GetHostId(), std::optional<uint64_t>(7));
    EXPECT_EQ(config.GetHostEnvVar(), "SUID_HOST_ID");
    EXPECT_TRUE(config.GetResolveFromNetwork());
    EXPECT_EQ(config.GetLogLevel(), "info");
}

TEST_F(ConfigTest, RejectsGroupAboveMaximum) {
    WriteConfig(R"({ "default_group": 9 })");

    Config config;
    absl::Status status = config.Load(config_path_);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);

    EXPECT_EQ(config.SetDefaultGroup(8).code(), absl::StatusCode::kInvalidArgument);
    EXPECT_TRUE(config.SetDefaultGroup(7).ok());
    EXPECT_EQ(config.GetDefaultGroup(), 7u);
}

TEST_F(ConfigTest, RejectsNegativeHostId) {
    WriteConfig(R"({ "host_id": -5 })");

    Config config;
    EXPECT_EQ(config.Load(config_path_).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ConfigTest, ToHostIdOptions) {
    Config config;
    config.SetHostId(4);
    config.SetHostEnvVar("MY_HOST");
    config.SetResolveFromNetwork(false);

    host::HostIdOptions options = config.ToHostIdOptions();
    EXPECT_EQ(options.host_id, std::optional<uint64_t>(4));
    EXPECT_EQ(options.env_var, "MY_HOST");
    EXPECT_FALSE(options.use_network);
    EXPECT_TRUE(options.use_hostname);
}

}  // namespace
}  // namespace suid

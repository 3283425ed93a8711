#include "filefuse/app_config.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "test_support.h"

namespace {

using filefuse::testing::ScopedEnvVar;

// Clears every override for the duration of a test.
class AppConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        chunkSize_.clear();
        bufferCapacity_.clear();
        workers_.clear();
        logLevel_.clear();
    }

    ScopedEnvVar chunkSize_{"FILEFUSE_CHUNK_SIZE"};
    ScopedEnvVar bufferCapacity_{"FILEFUSE_BUFFER_CAPACITY"};
    ScopedEnvVar workers_{"FILEFUSE_WORKERS"};
    ScopedEnvVar logLevel_{"LOG_LEVEL"};
};

TEST(ParseByteSizeTest, AcceptsSuffixes) {
    EXPECT_EQ(filefuse::parseByteSize("4096"), 4096u);
    EXPECT_EQ(filefuse::parseByteSize("12b"), 12u);
    EXPECT_EQ(filefuse::parseByteSize("64K"), 64u * 1024);
    EXPECT_EQ(filefuse::parseByteSize("2MiB"), 2u * 1024 * 1024);
    EXPECT_EQ(filefuse::parseByteSize("3 mb"), 3u * 1024 * 1024);
    EXPECT_EQ(filefuse::parseByteSize(" 1gb "), std::uint64_t{1} << 30);
    EXPECT_EQ(filefuse::parseByteSize("1GiB"), std::uint64_t{1} << 30);
}

TEST(ParseByteSizeTest, RejectsInvalidInput) {
    EXPECT_THROW(filefuse::parseByteSize(""), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("MiB"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("0"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("-5"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("5TB"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("1.5M"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("99999999999999999999"), std::invalid_argument);
    EXPECT_THROW(filefuse::parseByteSize("17179869184G"), std::invalid_argument);
}

TEST_F(AppConfigTest, DefaultsWithoutConfig) {
    const auto config = filefuse::loadAppConfig(YAML::Node{});
    EXPECT_EQ(config.chunkSize, filefuse::kDefaultChunkSize);
    EXPECT_EQ(config.bufferCapacity, filefuse::kDefaultBufferCapacity);
    EXPECT_EQ(config.workers, 0u);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(AppConfigTest, ReadsYamlSections) {
    const auto node = YAML::Load(R"(
fuse:
  chunk_size: 64KiB
  buffer_capacity: 4096
  workers: 3
logging:
  level: debug
)");
    const auto config = filefuse::loadAppConfig(node);
    EXPECT_EQ(config.chunkSize, 64u * 1024);
    EXPECT_EQ(config.bufferCapacity, 4096u);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.logLevel, "debug");

    const auto split = filefuse::splitOptionsFrom(config);
    EXPECT_EQ(split.chunkSize, 64u * 1024);
    EXPECT_EQ(split.bufferCapacity, 4096u);
    EXPECT_FALSE(split.inFile.has_value());
    EXPECT_EQ(filefuse::mergeOptionsFrom(config).bufferCapacity, 4096u);
}

TEST_F(AppConfigTest, EnvironmentOverridesYaml) {
    const auto node = YAML::Load("fuse:\n  chunk_size: 1MiB\n  workers: 2\nlogging:\n  level: warn\n");
    chunkSize_.set("8K");
    bufferCapacity_.set("512");
    workers_.set("6");
    logLevel_.set("trace");

    const auto config = filefuse::loadAppConfig(node);
    EXPECT_EQ(config.chunkSize, 8u * 1024);
    EXPECT_EQ(config.bufferCapacity, 512u);
    EXPECT_EQ(config.workers, 6u);
    EXPECT_EQ(config.logLevel, "trace");
}

TEST_F(AppConfigTest, EmptyEnvironmentValuesAreIgnored) {
    chunkSize_.set("");
    logLevel_.set("");
    const auto config = filefuse::loadAppConfig(YAML::Node{});
    EXPECT_EQ(config.chunkSize, filefuse::kDefaultChunkSize);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(AppConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(filefuse::loadAppConfig(YAML::Load("fuse:\n  chunk_size: lots\n")), std::invalid_argument);
    EXPECT_THROW(filefuse::loadAppConfig(YAML::Load("fuse:\n  workers: many\n")), std::invalid_argument);

    workers_.set("-1");
    EXPECT_THROW(filefuse::loadAppConfig(YAML::Node{}), std::invalid_argument);
}

}  // namespace

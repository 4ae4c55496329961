/// @file config_test.cpp
/// @brief Tests for DriftGuard configuration management

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common/config.h"
#include "common/error.h"

namespace driftguard {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
pipeline:
  metric: ks
metrics:
  psi:
    default_threshold: 0.1
logging:
  level: debug
  file: /tmp/driftguard.log
  max_files: 3
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("pipeline.metric"), "ks");
    EXPECT_EQ(config.GetString("metrics.psi.default_threshold"), "0.1");
    EXPECT_EQ(config.GetString("logging.level"), "debug");
    EXPECT_EQ(config.GetString("logging.file"), "/tmp/driftguard.log");
    EXPECT_EQ(config.GetInt("logging.max_files"), 3);
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("logging:\n  max_files: many\n  level: [info]\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("logging.max_files", 7), 7);
    EXPECT_EQ(result->GetString("logging.level", "info"), "info");
}

TEST(ConfigTest, LookupDoesNotCreateKeys) {
    auto result = Config::LoadFromString("metrics:\n  psi:\n    default_threshold: 0.1\n");
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);
    EXPECT_FALSE(config.HasKey("metrics.ks.default_threshold"));
    EXPECT_FALSE(config.HasKey("metrics.ks"));
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("pipeline.metric", "ks");
    config.Set("logging.max_files", "4");

    EXPECT_EQ(config.GetString("pipeline.metric"), "ks");
    EXPECT_EQ(config.GetInt("logging.max_files"), 4);
    EXPECT_TRUE(config.HasKey("logging"));
}

TEST(ConfigTest, SetOverwritesScalarWithMap) {
    Config config;
    config.Set("pipeline", "flat");
    config.Set("pipeline.metric", "psi");

    EXPECT_EQ(config.GetString("pipeline.metric"), "psi");
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(GetErrorCode(result.status()), ErrorCode::kConfigurationError);
}

TEST(ConfigTest, MissingFileIsNotFound) {
    auto result = Config::LoadFromFile("/nonexistent/driftguard.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

// =============================================================================
// Environment overrides
// =============================================================================

class ConfigEnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "driftguard_config_test.yaml";
        std::ofstream out(path_);
        out << "pipeline:\n  metric: psi\n  feature_type: numerical\n"
               "logging:\n  level: info\n";
    }

    void TearDown() override {
        unsetenv("DGTEST_METRIC");
        unsetenv("DGTEST_LOG_LEVEL");
        unsetenv("DGTEST_LOG_FILE");
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::filesystem::path path_;
};

TEST_F(ConfigEnvironmentTest, EnvironmentOnly) {
    setenv("DGTEST_METRIC", "ks", 1);

    const Config config = Config::LoadFromEnvironment("DGTEST_");
    EXPECT_EQ(config.GetString("pipeline.metric"), "ks");
    EXPECT_FALSE(config.HasKey("logging.level"));
}

TEST_F(ConfigEnvironmentTest, EnvironmentOverridesFile) {
    setenv("DGTEST_LOG_LEVEL", "debug", 1);

    auto config = Config::LoadWithEnvironment(path_, "DGTEST_");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->GetString("logging.level"), "debug");
    EXPECT_EQ(config->GetString("pipeline.metric"), "psi");
    EXPECT_EQ(config->GetString("pipeline.feature_type"), "numerical");
}

TEST_F(ConfigEnvironmentTest, LogFileFromEnvironment) {
    setenv("DGTEST_LOG_FILE", "/tmp/dg.log", 1);

    auto config = Config::LoadWithEnvironment(path_, "DGTEST_");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->GetString("logging.file"), "/tmp/dg.log");
    EXPECT_EQ(config->GetString("logging.level"), "info");
}

TEST_F(ConfigEnvironmentTest, NoFile) {
    auto config = Config::LoadWithEnvironment(std::nullopt, "DGTEST_");
    ASSERT_TRUE(config.ok());
    EXPECT_FALSE(config->HasKey("pipeline.metric"));
}

}  // namespace
}  // namespace driftguard

#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <spdlog/spdlog.h>
#include "codebox/config/engine_config.hpp"
#include "codebox/core/errors.hpp"
#include "temp_dir.hpp"

namespace {

using ::testing::HasSubstr;
using codebox::config::ConfigureLogging;
using codebox::config::EngineConfig;
using codebox::config::LoggingSettings;
using codebox::config::SandboxSettings;
using codebox::core::ConfigurationError;
using codebox::testing::TempDir;

// NOLINTNEXTLINE
TEST(EngineConfigTest, Defaults) {
  EngineConfig config;
  EXPECT_TRUE(config.sandbox.enabled);
  EXPECT_EQ(config.sandbox.timeout_seconds, 30);
  EXPECT_EQ(config.sandbox.memory_limit, "256m");
  EXPECT_EQ(config.sandbox.cpu_quota, 50000);
  EXPECT_EQ(config.sandbox.seccomp_profile_path, "docker/seccomp-profile.json");
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_NO_THROW(config.Validate());
}

// NOLINTNEXTLINE
TEST(EngineConfigTest, PartialDocumentKeepsDefaults) {
  auto config = EngineConfig::LoadFromString(
      R"({"sandbox": {"timeout_seconds": 10, "seccomp_profile_path": ""},
          "logging": {"level": "debug"}})");
  EXPECT_EQ(config.sandbox.timeout_seconds, 10);
  EXPECT_EQ(config.sandbox.seccomp_profile_path, "");
  EXPECT_EQ(config.sandbox.memory_limit, "256m");
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.pattern, LoggingSettings().pattern);
}

// NOLINTNEXTLINE
TEST(EngineConfigTest, RejectsBadDocuments) {
  EXPECT_THROW(EngineConfig::LoadFromString("{"), ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString("[]"), ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": {"timeout_seconds": "ten"}})"),
               ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": 5})"), ConfigurationError);
}

// NOLINTNEXTLINE
TEST(EngineConfigTest, RejectsOutOfRange) {
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": {"timeout_seconds": 0}})"),
               ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": {"memory_limit": "256mb"}})"),
               ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": {"cpu_quota": 10}})"),
               ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"sandbox": {"docker_binary": ""}})"),
               ConfigurationError);
  EXPECT_THROW(EngineConfig::LoadFromString(R"({"logging": {"level": "chatty"}})"),
               ConfigurationError);
}

// NOLINTNEXTLINE
TEST(EngineConfigTest, LoadFromFile) {
  TempDir dir;
  auto path = dir.Write("codebox.json", R"({"sandbox": {"enabled": false}})");
  EXPECT_FALSE(EngineConfig::LoadFromFile(path).sandbox.enabled);

  try {
    EngineConfig::LoadFromFile(dir.Path() / "missing.json");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("Configuration file not found"));
  }
}

// NOLINTNEXTLINE
TEST(EngineConfigTest, ConfigureLoggingSetsLevel) {
  LoggingSettings settings;
  settings.level = "WARN";
  ConfigureLogging(settings);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  settings.level = "info";
  ConfigureLogging(settings);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

}  // namespace

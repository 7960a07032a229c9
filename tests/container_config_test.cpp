#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/core/container_config.hpp"
#include "codebox/core/errors.hpp"

namespace {

using ::testing::ElementsAre;
using codebox::core::ConfigurationError;
using codebox::core::ContainerConfig;
using codebox::core::ContainerConfigBuilder;

const std::vector<std::string> kPython = {"python", "-c"};

// NOLINTNEXTLINE
TEST(ContainerConfigTest, Defaults) {
  ContainerConfig config("codebox-python:latest", kPython);
  EXPECT_EQ(config.Image(), "codebox-python:latest");
  EXPECT_THAT(config.Command(), ElementsAre("python", "-c"));
  EXPECT_EQ(config.TimeoutSeconds(), 30);
  EXPECT_EQ(config.MemoryLimit(), "256m");
  EXPECT_EQ(config.CpuQuota(), 50000);
  EXPECT_FALSE(config.NetworkEnabled());
  EXPECT_TRUE(config.ReadOnly());
  EXPECT_EQ(config.PidsLimit(), 50);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, MemoryLimitFormat) {
  EXPECT_NO_THROW(ContainerConfig("img", kPython, 30, "256m"));
  EXPECT_NO_THROW(ContainerConfig("img", kPython, 30, "1g"));
  EXPECT_NO_THROW(ContainerConfig("img", kPython, 30, "512k"));
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "256mb"), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "lots"), ConfigurationError);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, Ranges) {
  EXPECT_NO_THROW(ContainerConfig("img", kPython, 1));
  EXPECT_NO_THROW(ContainerConfig("img", kPython, 300));
  EXPECT_THROW(ContainerConfig("img", kPython, 0), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 301), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "256m", 999), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "256m", 1000001), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "256m", 50000, false, true, 0),
               ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", kPython, 30, "256m", 50000, false, true, 1001),
               ConfigurationError);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, ImageAndCommand) {
  EXPECT_THROW(ContainerConfig("", kPython), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img$(id)", kPython), ConfigurationError);
  EXPECT_THROW(ContainerConfig("img", {}), ConfigurationError);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, Builder) {
  auto config = ContainerConfigBuilder()
                    .WithImage("codebox-python:latest")
                    .WithCommand(kPython)
                    .WithTimeout(10)
                    .WithMemoryLimit("128m")
                    .WithCpuQuota(100000)
                    .WithNetwork(true)
                    .WithReadOnlyRootfs(false)
                    .WithPidsLimit(20)
                    .Build();
  EXPECT_EQ(config.TimeoutSeconds(), 10);
  EXPECT_EQ(config.MemoryLimit(), "128m");
  EXPECT_EQ(config.CpuQuota(), 100000);
  EXPECT_TRUE(config.NetworkEnabled());
  EXPECT_FALSE(config.ReadOnly());
  EXPECT_EQ(config.PidsLimit(), 20);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, BuilderValidates) {
  EXPECT_THROW(ContainerConfigBuilder().WithCommand(kPython).Build(), ConfigurationError);
  EXPECT_THROW(
      ContainerConfigBuilder().WithImage("img").WithCommand(kPython).WithTimeout(500).Build(),
      ConfigurationError);
}

// NOLINTNEXTLINE
TEST(ContainerConfigTest, RejectsFlagShapedImage) {
  EXPECT_THROW(ContainerConfigBuilder().WithImage("--privileged").WithCommand(kPython).Build(),
               ConfigurationError);
}

}  // namespace

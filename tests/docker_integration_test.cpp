#include <memory>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/core/sandbox_manager.hpp"
#include "codebox/runtimes/python_runtime.hpp"
#include "codebox/tools/execute_tool.hpp"
#include "codebox/utils/docker_cli_client.hpp"

// These tests talk to a real Docker daemon and skip themselves when none
// is reachable or the sandbox image cannot be built.

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using codebox::config::SandboxSettings;
using codebox::core::SandboxManager;
using codebox::runtimes::PythonRuntime;
using codebox::tools::ExecuteTool;
using codebox::utils::DockerCliClient;

class DockerIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto client = std::make_shared<DockerCliClient>();
    try {
      client->Ping();
    } catch (const std::exception& e) {
      GTEST_SKIP() << "Docker daemon not available: " << e.what();
    }

    SandboxSettings settings;
    settings.seccomp_profile_path = std::string(CODEBOX_SOURCE_DIR) + "/docker/seccomp-profile.json";
    settings.build_context = std::string(CODEBOX_SOURCE_DIR) + "/docker";
    manager_ = std::make_unique<SandboxManager>(client, settings);

    auto config = PythonRuntime::DefaultConfig();
    if (!manager_->EnsureImage(config.image, std::string("Dockerfile.python"),
                               settings.build_context)) {
      GTEST_SKIP() << "Image " << config.image << " is not available";
    }
    python_ = std::make_unique<PythonRuntime>(*manager_);
  }

  std::unique_ptr<SandboxManager> manager_;
  std::unique_ptr<PythonRuntime> python_;
};

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, HelloWorld) {
  auto result = python_->Run("print('Hello, World!')");
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_output, "Hello, World!\n");
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, RuntimeErrorIsReported) {
  auto result = python_->Run("1/0");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_THAT(result.stderr_output, HasSubstr("ZeroDivisionError"));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, TimeoutIsEnforced) {
  ExecuteTool tool(*python_);
  EXPECT_THAT(tool.Execute("import time\ntime.sleep(10)\n", 2),
              StartsWith("Execution timed out after 2s"));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, TimedOutRunIsBounded) {
  auto result = python_->Run("import time\ntime.sleep(10)\n", 2);
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.success);
  EXPECT_GE(result.execution_time_ms, 2000);
  EXPECT_LT(result.execution_time_ms, 10000);
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, NetworkIsDisabled) {
  auto result = python_->Run(
      "import socket\n"
      "socket.create_connection(('1.1.1.1', 53), timeout=2)\n");
  EXPECT_FALSE(result.success);
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, RootFilesystemIsReadOnly) {
  auto result = python_->Run("open('/etc/codebox', 'w').write('x')\n");
  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.stderr_output, ::testing::AnyOf(HasSubstr("Read-only file system"),
                                                      HasSubstr("Permission denied")));
}

// NOLINTNEXTLINE
TEST_F(DockerIntegrationTest, PytestWrapper) {
  auto result = python_->RunTests("def add(a, b):\n    return a + b\n",
                                  "def test_add():\n    assert add(2, 3) == 5\n");
  EXPECT_TRUE(result.success) << result.stdout_output << result.stderr_output;
  EXPECT_THAT(result.stdout_output, HasSubstr("1 passed"));
}

}  // namespace

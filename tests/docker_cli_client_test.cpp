#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/core/sandbox_manager.hpp"
#include "codebox/utils/docker_cli_client.hpp"
#include "temp_dir.hpp"

namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using codebox::config::SandboxSettings;
using codebox::core::ContainerConfig;
using codebox::core::SandboxManager;
using codebox::testing::TempDir;
using codebox::utils::ClientError;
using codebox::utils::ClientErrorKind;
using codebox::utils::ContainerSpec;
using codebox::utils::DockerCliClient;

// Writes an executable `docker` stand-in that appends its arguments to
// calls.log and then runs `cases` (a shell case body keyed on "$1").
std::string FakeDocker(const TempDir& dir, const std::string& cases) {
  std::string log = (dir.Path() / "calls.log").string();
  auto script = dir.Write("docker",
                          "#!/bin/sh\n"
                          "echo \"$*\" >> '" + log + "'\n"
                          "case \"$1\" in\n" + cases +
                          "  *) ;;\n"
                          "esac\n");
  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_exec |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::add);
  return script.string();
}

std::vector<std::string> Calls(const TempDir& dir) {
  std::ifstream in(dir.Path() / "calls.log");
  std::vector<std::string> calls;
  std::string line;
  while (std::getline(in, line)) calls.push_back(line);
  return calls;
}

ContainerSpec SpecWithPayload(const std::string& payload) {
  ContainerSpec spec;
  spec.image = "codebox-python:latest";
  spec.command = {"python", "-c", payload};
  return spec;
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, WaitReturnsExitCode) {
  TempDir dir;
  DockerCliClient client(FakeDocker(dir,
                                    "  wait) echo 3 ;;\n"
                                    "  inspect) echo ;;\n"));
  EXPECT_EQ(client.Wait("abc123", std::chrono::seconds(5)), 3);
  EXPECT_THAT(Calls(dir), Contains("wait abc123"));
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, WaitTimesOut) {
  TempDir dir;
  DockerCliClient client(FakeDocker(dir, "  wait) exec sleep 10 ;;\n"));
  auto start = std::chrono::steady_clock::now();
  try {
    client.Wait("abc123", std::chrono::seconds(1));
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kTimeout);
    EXPECT_THAT(e.what(), HasSubstr("1s"));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, WaitReportsStateError) {
  TempDir dir;
  DockerCliClient client(FakeDocker(dir,
                                    "  wait) echo 127 ;;\n"
                                    "  inspect) echo 'exec: \"pythn\": executable file not found' ;;\n"
                                    "  logs) echo partial; echo trace >&2 ;;\n"));
  try {
    client.Wait("abc123", std::chrono::seconds(5));
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kContainerError);
    EXPECT_THAT(e.what(), HasSubstr("executable file not found"));
    EXPECT_EQ(e.ExitCode(), 127);
    EXPECT_EQ(e.PartialStdout(), "partial\n");
    EXPECT_EQ(e.PartialStderr(), "trace\n");
  }
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, FailedStartRemovesContainer) {
  TempDir dir;
  DockerCliClient client(FakeDocker(dir,
                                    "  create) echo abc123 ;;\n"
                                    "  start) echo 'OCI runtime create failed: boom' >&2; exit 1 ;;\n"));
  try {
    client.RunDetached(SpecWithPayload("print(1)"));
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kContainerError);
    EXPECT_THAT(e.what(), HasSubstr("boom"));
    EXPECT_EQ(e.ExitCode(), 1);
  }
  auto calls = Calls(dir);
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_THAT(calls[0], HasSubstr("create"));
  EXPECT_EQ(calls[1], "start abc123");
  EXPECT_EQ(calls[2], "rm --force abc123");
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, MissingBinaryIsDaemonUnavailable) {
  TempDir dir;
  DockerCliClient client((dir.Path() / "absent").string());
  try {
    client.Info();
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kDaemonUnavailable);
  }
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, NonExecutableBinaryIsDaemonUnavailable) {
  TempDir dir;
  auto binary = dir.Write("docker", "#!/bin/sh\n");
  std::filesystem::permissions(binary, std::filesystem::perms::owner_read |
                                           std::filesystem::perms::owner_write);
  DockerCliClient client(binary.string());
  try {
    client.Info();
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kDaemonUnavailable);
  }
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, OversizedArgumentIsContainerError) {
  TempDir dir;
  DockerCliClient client(FakeDocker(dir, "  create) echo abc123 ;;\n"));
  try {
    client.RunDetached(SpecWithPayload(std::string(200000, 'x')));
    FAIL() << "expected ClientError";
  } catch (const ClientError& e) {
    EXPECT_EQ(e.Kind(), ClientErrorKind::kContainerError);
    EXPECT_THAT(e.what(), HasSubstr("too large"));
  }
  EXPECT_TRUE(Calls(dir).empty());
}

// NOLINTNEXTLINE
TEST(DockerCliClientTest, OversizedPayloadBecomesFailedResult) {
  TempDir dir;
  SandboxSettings settings;
  settings.seccomp_profile_path = "";
  auto client = std::make_shared<DockerCliClient>(FakeDocker(dir,
                                                             "  version) echo 27.0.1 ;;\n"
                                                             "  create) echo abc123 ;;\n"
                                                             "  wait) echo 0 ;;\n"
                                                             "  inspect) echo ;;\n"
                                                             "  logs) echo small ;;\n"));
  SandboxManager manager(client, settings);
  ContainerConfig config("codebox-python:latest", {"python", "-c"}, 5);

  auto small = manager.RunContainer(config, "print(1)");
  EXPECT_TRUE(small.success);
  EXPECT_EQ(small.stdout_output, "small\n");

  auto big = manager.RunContainer(config, std::string(200000, 'x'));
  EXPECT_FALSE(big.success);
  EXPECT_FALSE(big.timed_out);
  ASSERT_TRUE(big.error_message.has_value());
  EXPECT_THAT(*big.error_message, HasSubstr("too large"));
}

}  // namespace

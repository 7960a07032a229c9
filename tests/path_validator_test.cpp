#include <filesystem>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/core/errors.hpp"
#include "codebox/security/path_validator.hpp"
#include "temp_dir.hpp"

namespace {

using codebox::core::ConfigurationError;
using codebox::security::PathValidator;
using codebox::testing::TempDir;

namespace fs = std::filesystem;

// NOLINTNEXTLINE
TEST(PathValidatorTest, ImageNames) {
  EXPECT_TRUE(PathValidator::IsValidImageName("codebox-python:latest"));
  EXPECT_TRUE(PathValidator::IsValidImageName("registry.local/team/img_1:3.12"));
  EXPECT_FALSE(PathValidator::IsValidImageName(""));
  EXPECT_FALSE(PathValidator::IsValidImageName("   "));
  EXPECT_FALSE(PathValidator::IsValidImageName("img; rm -rf /"));
  EXPECT_FALSE(PathValidator::IsValidImageName("../img"));
  EXPECT_FALSE(PathValidator::IsValidImageName("img name"));
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, ImageNamesCannotLookLikeFlags) {
  EXPECT_FALSE(PathValidator::IsValidImageName("--privileged"));
  EXPECT_FALSE(PathValidator::IsValidImageName("-v/:/host"));
  EXPECT_FALSE(PathValidator::IsValidImageName(":latest"));
  EXPECT_FALSE(PathValidator::IsValidImageName("/img"));
  EXPECT_TRUE(PathValidator::IsValidImageName("0img"));
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, MemoryLimits) {
  EXPECT_TRUE(PathValidator::IsValidMemoryLimit("256m"));
  EXPECT_TRUE(PathValidator::IsValidMemoryLimit("1g"));
  EXPECT_TRUE(PathValidator::IsValidMemoryLimit("512k"));
  EXPECT_TRUE(PathValidator::IsValidMemoryLimit("512M"));
  EXPECT_FALSE(PathValidator::IsValidMemoryLimit("256mb"));
  EXPECT_FALSE(PathValidator::IsValidMemoryLimit("256"));
  EXPECT_FALSE(PathValidator::IsValidMemoryLimit("m"));
  EXPECT_FALSE(PathValidator::IsValidMemoryLimit("-1m"));
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, StrictDescendant) {
  EXPECT_TRUE(PathValidator::IsStrictDescendant("/srv/docker", "/srv/docker/Dockerfile"));
  EXPECT_TRUE(PathValidator::IsStrictDescendant("/srv/docker/", "/srv/docker/a/b"));
  EXPECT_FALSE(PathValidator::IsStrictDescendant("/srv/docker", "/srv/docker"));
  EXPECT_FALSE(PathValidator::IsStrictDescendant("/srv/docker", "/srv/dockerfiles/x"));
  EXPECT_FALSE(PathValidator::IsStrictDescendant("/srv/docker", "/etc/passwd"));
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, ResolvesInsideContext) {
  TempDir dir;
  dir.Write("Dockerfile.python", "FROM python:3.12-slim\n");
  auto resolved = PathValidator::ResolveDockerfile("Dockerfile.python", dir.Path().string());
  EXPECT_EQ(resolved.context, fs::canonical(dir.Path()));
  EXPECT_EQ(resolved.dockerfile, fs::canonical(dir.Path()) / "Dockerfile.python");
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, RejectsTraversal) {
  TempDir dir;
  EXPECT_THROW(PathValidator::ResolveDockerfile("../../etc/passwd", dir.Path().string()),
               ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile("sub/../../Dockerfile", dir.Path().string()),
               ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile("/etc/passwd", dir.Path().string()),
               ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile("", dir.Path().string()), ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile(".", dir.Path().string()), ConfigurationError);
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, RejectsSymlinkEscape) {
  TempDir outside;
  auto target = outside.Write("Dockerfile", "FROM scratch\n");
  TempDir context;
  fs::create_symlink(target, context.Path() / "Dockerfile.evil");
  EXPECT_THROW(PathValidator::ResolveDockerfile("Dockerfile.evil", context.Path().string()),
               ConfigurationError);
}

// NOLINTNEXTLINE
TEST(PathValidatorTest, RejectsBadContext) {
  TempDir dir;
  auto file = dir.Write("plain.txt", "x");
  EXPECT_THROW(PathValidator::ResolveDockerfile("Dockerfile", (dir.Path() / "missing").string()),
               ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile("Dockerfile", file.string()),
               ConfigurationError);
  EXPECT_THROW(PathValidator::ResolveDockerfile("Dockerfile", ""), ConfigurationError);
}

}  // namespace

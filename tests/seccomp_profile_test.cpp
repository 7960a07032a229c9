#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/core/errors.hpp"
#include "codebox/security/seccomp_profile.hpp"
#include "temp_dir.hpp"

namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using codebox::core::SeccompError;
using codebox::core::SeccompNotFoundError;
using codebox::core::SeccompParseError;
using codebox::core::SeccompSchemaError;
using codebox::security::ParseSeccompAction;
using codebox::security::SeccompAction;
using codebox::security::SeccompProfile;
using codebox::testing::TempDir;

// NOLINTNEXTLINE
TEST(SeccompProfileTest, ParsesValidProfile) {
  auto profile = SeccompProfile::Parse(R"({
    "defaultAction": "SCMP_ACT_ERRNO",
    "architectures": ["SCMP_ARCH_X86_64"],
    "syscalls": [{"names": ["read", "write"], "action": "SCMP_ACT_ALLOW"},
                 {"names": [], "action": "SCMP_ACT_LOG"}]
  })");
  EXPECT_EQ(profile.DefaultAction(), SeccompAction::kErrno);
  EXPECT_THAT(profile.Architectures(), Contains("SCMP_ARCH_X86_64"));
  ASSERT_EQ(profile.Rules().size(), 2u);
  EXPECT_EQ(profile.Rules()[0].names.size(), 2u);
  EXPECT_EQ(profile.Rules()[0].action, SeccompAction::kAllow);
  EXPECT_TRUE(profile.Rules()[1].names.empty());
  EXPECT_EQ(profile.Rules()[1].action, SeccompAction::kLog);
  EXPECT_TRUE(profile.SourcePath().empty());
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, ActionNames) {
  EXPECT_EQ(ParseSeccompAction("SCMP_ACT_KILL_PROCESS"), SeccompAction::kKillProcess);
  EXPECT_FALSE(ParseSeccompAction("SCMP_ACT_MAYBE").has_value());
  EXPECT_EQ(ToString(SeccompAction::kNotify), "SCMP_ACT_NOTIFY");
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, MissingFile) {
  TempDir dir;
  try {
    SeccompProfile::Load(dir.Path() / "absent.json");
    FAIL() << "expected SeccompNotFoundError";
  } catch (const SeccompNotFoundError& e) {
    EXPECT_THAT(e.Path(), HasSubstr("absent.json"));
    EXPECT_THAT(e.what(), HasSubstr("not found"));
  }
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, DirectoryIsNotAProfile) {
  TempDir dir;
  EXPECT_THROW(SeccompProfile::Load(dir.Path()), SeccompNotFoundError);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, InvalidJson) {
  EXPECT_THROW(SeccompProfile::Parse("{not json"), SeccompParseError);
  EXPECT_THROW(SeccompProfile::Parse("[1, 2]"), SeccompParseError);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, SchemaViolations) {
  try {
    SeccompProfile::Parse(R"({"syscalls": []})");
    FAIL() << "expected SeccompSchemaError";
  } catch (const SeccompSchemaError& e) {
    EXPECT_EQ(e.Field(), "defaultAction");
    EXPECT_FALSE(e.Index().has_value());
  }

  try {
    SeccompProfile::Parse(
        R"({"defaultAction": "SCMP_ACT_ALLOW",)"
        R"( "syscalls": [{"names": ["read"], "action": "SCMP_ACT_ALLOW"}, "bad"]})");
    FAIL() << "expected SeccompSchemaError";
  } catch (const SeccompSchemaError& e) {
    EXPECT_EQ(e.Field(), "syscalls");
    EXPECT_EQ(e.Index(), 1u);
    EXPECT_THAT(e.what(), HasSubstr("syscalls[1]"));
  }

  EXPECT_THROW(SeccompProfile::Parse(R"({"defaultAction": "SCMP_ACT_NOPE"})"),
               SeccompSchemaError);
  EXPECT_THROW(SeccompProfile::Parse(R"({"defaultAction": "SCMP_ACT_ALLOW", "architectures": "x86"})"),
               SeccompSchemaError);
  EXPECT_THROW(SeccompProfile::Parse(
                   R"({"defaultAction": "SCMP_ACT_ALLOW", "syscalls": [{"names": [1]}]})"),
               SeccompSchemaError);
  EXPECT_THROW(SeccompProfile::Parse(
                   R"({"defaultAction": "SCMP_ACT_ALLOW", "syscalls": [{"action": 3}]})"),
               SeccompSchemaError);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, RuleRequiresNamesAndAction) {
  try {
    SeccompProfile::Parse(
        R"({"defaultAction": "SCMP_ACT_ALLOW", "syscalls": [{"names": ["ptrace"]}]})");
    FAIL() << "expected SeccompSchemaError";
  } catch (const SeccompSchemaError& e) {
    EXPECT_EQ(e.Field(), "syscalls.action");
    EXPECT_EQ(e.Index(), 0u);
    EXPECT_THAT(e.what(), HasSubstr("missing required field"));
  }

  try {
    SeccompProfile::Parse(R"({"defaultAction": "SCMP_ACT_ALLOW",)"
                          R"( "syscalls": [{"names": ["ptrace"], "action": "SCMP_ACT_ERRNO"}, {}]})");
    FAIL() << "expected SeccompSchemaError";
  } catch (const SeccompSchemaError& e) {
    EXPECT_EQ(e.Field(), "syscalls.names");
    EXPECT_EQ(e.Index(), 1u);
  }

  EXPECT_THROW(SeccompProfile::Parse(
                   R"({"defaultAction": "SCMP_ACT_ALLOW", "syscalls": [{"action": "SCMP_ACT_LOG"}]})"),
               SeccompSchemaError);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, ErrorsShareBase) {
  EXPECT_THROW(SeccompProfile::Parse("nope"), SeccompError);
  EXPECT_THROW(SeccompProfile::Parse("{}"), SeccompError);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, LoadRemembersPath) {
  TempDir dir;
  auto path = dir.Write("profile.json", R"({"defaultAction": "SCMP_ACT_ALLOW"})");
  auto profile = SeccompProfile::Load(path);
  EXPECT_EQ(profile.SourcePath(), path);
  EXPECT_EQ(profile.DefaultAction(), SeccompAction::kAllow);
}

// NOLINTNEXTLINE
TEST(SeccompProfileTest, ShippedProfileIsValid) {
  auto profile = SeccompProfile::Load(std::string(CODEBOX_SOURCE_DIR) +
                                      "/docker/seccomp-profile.json");
  EXPECT_EQ(profile.DefaultAction(), SeccompAction::kAllow);
  ASSERT_FALSE(profile.Rules().empty());
  EXPECT_THAT(profile.Rules()[0].names, Contains("ptrace"));
  EXPECT_EQ(profile.Rules()[0].action, SeccompAction::kErrno);
}

}  // namespace

// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include "attrcache/Jit/config.h"
#include "attrcache/Jit/flag_processor.h"
#include "attrcache/Jit/init.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>

// Here we make sure that the attrcache specific command line arguments are
// being processed correctly to have the required effect on the config.

using namespace attrcache;

class CmdLineTest : public ::testing::Test {
 public:
  void SetUp() override {
    finalize();
  }

  void TearDown() override {
    finalize();
  }
};

namespace {

// Apply an option first as an environment variable and then as an X-option,
// checking the effect on the config after each.  Returns the sum of both
// initialize() results.
int try_flag_and_envvar_effect(
    const char* flag,
    const char* flag_value,
    const char* env_name,
    const char* env_value,
    std::function<void(void)> conditions_to_check) {
  int init_status = 0;

  if (env_name != nullptr) {
    setenv(env_name, env_value, 1);
    init_status += initialize(XOptions{});
    conditions_to_check();
    unsetenv(env_name);
    finalize();
  }

  XOptions xoptions;
  xoptions.emplace(flag, flag_value);
  init_status += initialize(xoptions);
  conditions_to_check();
  finalize();

  return init_status;
}

} // namespace

TEST_F(CmdLineTest, BasicFlags) {
  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-debug",
          "",
          "PYTHONATTRCACHEDEBUG",
          "1",
          []() { ASSERT_TRUE(getConfig().log.debug); }),
      0);

  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-disable",
          "",
          "PYTHONATTRCACHEDISABLE",
          "1",
          []() { ASSERT_FALSE(getConfig().attr_caches); }),
      0);

  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-stats",
          "1",
          "PYTHONATTRCACHESTATS",
          "1",
          []() { ASSERT_TRUE(getConfig().collect_attr_cache_stats); }),
      0);

  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-size",
          "8",
          "PYTHONATTRCACHESIZE",
          "8",
          []() { ASSERT_EQ(getConfig().attr_cache_size, 8); }),
      0);

  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-version-bump-limit",
          "17",
          "PYTHONATTRCACHEVERSIONBUMPLIMIT",
          "17",
          []() { ASSERT_EQ(getConfig().type_version_bump_limit, 17); }),
      0);

  ASSERT_EQ(
      try_flag_and_envvar_effect(
          "attrcache-max-version-tag",
          "4096",
          "PYTHONATTRCACHEMAXVERSIONTAG",
          "4096",
          []() { ASSERT_EQ(getConfig().max_version_tag, 4096); }),
      0);
}

TEST_F(CmdLineTest, Defaults) {
  ASSERT_EQ(initialize(XOptions{}), 0);
  EXPECT_TRUE(isInitialized());
  EXPECT_TRUE(getConfig().attr_caches);
  EXPECT_FALSE(getConfig().collect_attr_cache_stats);
  EXPECT_FALSE(getConfig().log.debug);
  EXPECT_EQ(getConfig().attr_cache_size, 4);
  EXPECT_EQ(getConfig().type_version_bump_limit, 1000);
  finalize();
  EXPECT_FALSE(isInitialized());
}

TEST_F(CmdLineTest, XOptionBeatsEnvironment) {
  setenv("PYTHONATTRCACHESIZE", "2", 1);
  XOptions xoptions;
  xoptions.emplace("attrcache-size", "6");
  ASSERT_EQ(initialize(xoptions), 0);
  EXPECT_EQ(getConfig().attr_cache_size, 6);
  unsetenv("PYTHONATTRCACHESIZE");
}

TEST_F(CmdLineTest, ZeroDisableLeavesCachesOn) {
  XOptions xoptions;
  xoptions.emplace("attrcache-disable", "0");
  ASSERT_EQ(initialize(xoptions), 0);
  EXPECT_TRUE(getConfig().attr_caches);
}

TEST_F(CmdLineTest, InvalidValuesAreIgnored) {
  testing::internal::CaptureStderr();
  XOptions xoptions;
  xoptions.emplace("attrcache-size", "99");
  xoptions.emplace("attrcache-version-bump-limit", "lots");
  ASSERT_EQ(initialize(xoptions), 0);
  std::string output = testing::internal::GetCapturedStderr();
  EXPECT_EQ(getConfig().attr_cache_size, 4);
  EXPECT_EQ(getConfig().type_version_bump_limit, 1000);
  EXPECT_NE(output.find("attrcache-size must be between 1 and 16"), std::string::npos);
  EXPECT_NE(
      output.find("Invalid unsigned value for attrcache-version-bump-limit"),
      std::string::npos);
}

TEST_F(CmdLineTest, UnknownOptionWarns) {
  testing::internal::CaptureStderr();
  XOptions xoptions;
  xoptions.emplace("attrcache-bogus", "");
  xoptions.emplace("unrelated-option", "");
  ASSERT_EQ(initialize(xoptions), 0);
  std::string output = testing::internal::GetCapturedStderr();
  EXPECT_NE(
      output.find("attrcache cannot handle X-option attrcache-bogus"),
      std::string::npos);
  EXPECT_EQ(output.find("unrelated-option"), std::string::npos);
}

TEST_F(CmdLineTest, HelpPrintsOptions) {
  testing::internal::CaptureStdout();
  XOptions xoptions;
  xoptions.emplace("attrcache-help", "");
  ASSERT_EQ(initialize(xoptions), -2);
  std::string output = testing::internal::GetCapturedStdout();
  EXPECT_FALSE(isInitialized());
  EXPECT_NE(output.find("-X attrcache-size=<entries>"), std::string::npos);
  EXPECT_NE(output.find("PYTHONATTRCACHESIZE"), std::string::npos);
  // Hidden options stay out of the help.
  EXPECT_EQ(output.find("attrcache-max-version-tag"), std::string::npos);
}

TEST_F(CmdLineTest, LogFileWithPid) {
  auto dir = std::filesystem::temp_directory_path();
  std::string pattern = (dir / "attrcache_test_{pid}.log").string();
  XOptions xoptions;
  xoptions.emplace("attrcache-log-file", pattern);
  ASSERT_EQ(initialize(xoptions), 0);
  std::string filename = getConfig().log.filename;
  EXPECT_EQ(filename.find("{pid}"), std::string::npos);
  EXPECT_NE(getConfig().log.output_file, stderr);
  finalize();
  EXPECT_EQ(getConfig().log.output_file, stderr);
  EXPECT_TRUE(std::filesystem::exists(filename));
  std::filesystem::remove(filename);
}

TEST_F(CmdLineTest, InitializeTwiceKeepsFirstConfig) {
  XOptions first;
  first.emplace("attrcache-size", "3");
  ASSERT_EQ(initialize(first), 0);
  XOptions second;
  second.emplace("attrcache-size", "5");
  ASSERT_EQ(initialize(second), 0);
  EXPECT_EQ(getConfig().attr_cache_size, 3);
}

TEST(FlagProcessorTest, CanHandleRegisteredOptions) {
  FlagProcessor processor = initFlagProcessor();
  EXPECT_TRUE(processor.hasOptions());
  EXPECT_TRUE(processor.canHandle("attrcache-size"));
  EXPECT_TRUE(processor.canHandle("attrcache-help"));
  EXPECT_FALSE(processor.canHandle("attrcache-bogus"));
}

TEST(FlagProcessorTest, UnsignedOptionsEnforceTheirRange) {
  FlagProcessor processor;
  uint32_t level = 7;
  processor.addUnsigned(
      "test-level",
      "",
      "level",
      2,
      5,
      [&](uint32_t value) { level = value; },
      "test level");

  auto apply = [&](const char* value) {
    XOptions xoptions;
    xoptions.emplace("test-level", value);
    testing::internal::CaptureStderr();
    processor.setFlags(xoptions, "test-");
    return testing::internal::GetCapturedStderr();
  };

  EXPECT_NE(
      apply("9").find("test-level must be between 2 and 5, got 9"),
      std::string::npos);
  EXPECT_EQ(level, 7);
  EXPECT_NE(
      apply("-3").find("Invalid unsigned value for test-level: -3"),
      std::string::npos);
  EXPECT_NE(apply("4x").find("Invalid unsigned value"), std::string::npos);
  // A bare option means 1, which is below the minimum here.
  EXPECT_NE(apply("").find("got 1"), std::string::npos);
  EXPECT_EQ(level, 7);
  EXPECT_EQ(apply("5"), "");
  EXPECT_EQ(level, 5);
}

TEST(FlagProcessorTest, SwitchValues) {
  FlagProcessor processor;
  int calls = 0;
  bool enabled = false;
  processor.addSwitch(
      "test-switch",
      "",
      [&](bool on) {
        calls++;
        enabled = on;
      },
      "test switch");

  auto apply = [&](const char* value) {
    XOptions xoptions;
    xoptions.emplace("test-switch", value);
    processor.setFlags(xoptions, "test-");
  };

  apply("");
  EXPECT_TRUE(enabled);
  apply("0");
  EXPECT_FALSE(enabled);
  apply("-2");
  EXPECT_TRUE(enabled);
  testing::internal::CaptureStderr();
  apply("yes");
  std::string output = testing::internal::GetCapturedStderr();
  EXPECT_NE(output.find("Invalid value for test-switch: yes"), std::string::npos);
  EXPECT_EQ(calls, 3);
}

TEST(FlagProcessorTest, HelpLinesAreWrapped) {
  std::string help = initFlagProcessor().xOptionHelpMessage();
  // Skip the heading.
  size_t start = help.find("\n\n") + 2;
  while (start < help.size()) {
    size_t end = help.find('\n', start);
    if (end == std::string::npos) {
      end = help.size();
    }
    EXPECT_LE(end - start, 80) << help.substr(start, end - start);
    start = end + 1;
  }
  EXPECT_NE(
      help.find("-X attrcache-log-file=<filename>: write log entries"),
      std::string::npos);
  EXPECT_NE(help.find("-X attrcache-debug: attrcache"), std::string::npos);
}

#include <memory>
#include <span>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hkr/hook/configured_hook.hpp"
#include "hkr/hook/registry.hpp"
#include "test_utils.hpp"

namespace hkr::hook::test {

namespace {

auto files_of(std::vector<std::string> files) -> FileList {
  return std::make_shared<std::vector<std::string> const>(std::move(files));
}

auto fixed_check(HookStatus status, std::string output = "") -> Check {
  return [status, output](std::span<std::string const>) -> core::Result<HookOutcome> {
    return HookOutcome{status, output};
  };
}

} // namespace

TEST(ConfiguredHookTest, DefaultDescription) {
  ConfiguredHook hook("Lint", HookSettings{}, fixed_check(HookStatus::Pass), nullptr);
  EXPECT_EQ(hook.name(), "Lint");
  EXPECT_EQ(hook.description(), "Run Lint");

  HookSettings settings;
  settings.description_ = "Analyze with lint";
  ConfiguredHook described("Lint", settings, fixed_check(HookStatus::Pass), nullptr);
  EXPECT_EQ(described.description(), "Analyze with lint");
}

TEST(ConfiguredHookTest, OnFailAndOnWarnTransformStatus) {
  HookSettings settings;
  settings.on_fail_ = HookStatus::Warn;
  ConfiguredHook failing("Lint", settings, fixed_check(HookStatus::Fail, "bad"), nullptr);

  auto outcome = failing.run_and_transform();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->status_, HookStatus::Warn);
  EXPECT_EQ(outcome->output_, "bad");

  settings.on_warn_ = HookStatus::Pass;
  ConfiguredHook warning("Lint", settings, fixed_check(HookStatus::Warn), nullptr);
  EXPECT_EQ(warning.run_and_transform()->status_, HookStatus::Pass);
}

TEST(ConfiguredHookTest, RequiresFilesControlsWouldRun) {
  HookSettings settings;
  settings.requires_files_ = true;

  ConfiguredHook without_files("Lint", settings, fixed_check(HookStatus::Pass), files_of({}));
  EXPECT_FALSE(without_files.would_run());

  ConfiguredHook with_files("Lint", settings, fixed_check(HookStatus::Pass), files_of({"a.cpp"}));
  EXPECT_TRUE(with_files.would_run());

  settings.enabled_ = false;
  ConfiguredHook disabled("Lint", settings, fixed_check(HookStatus::Pass), files_of({"a.cpp"}));
  EXPECT_FALSE(disabled.would_run());
}

TEST(ConfiguredHookTest, CheckReceivesFiles) {
  std::vector<std::string> seen;
  Check                    check = [&seen](std::span<std::string const> files) -> core::Result<HookOutcome> {
    seen.assign(files.begin(), files.end());
    return HookOutcome{HookStatus::Pass, ""};
  };

  ConfiguredHook hook("Lint", HookSettings{}, check, files_of({"a.cpp", "b.cpp"}));
  ASSERT_TRUE(hook.run_and_transform().has_value());
  EXPECT_EQ(seen, (std::vector<std::string>{"a.cpp", "b.cpp"}));
}

TEST(ConfiguredHookTest, MissingExecutableFailsWithInstallHint) {
  HookSettings settings;
  settings.required_executable_ = "hkr-definitely-not-a-command";
  settings.install_command_     = "apt install hkr-tools";

  bool           ran = false;
  ConfiguredHook hook(
      "Lint",
      settings,
      [&ran](std::span<std::string const>) -> core::Result<HookOutcome> {
        ran = true;
        return HookOutcome{HookStatus::Pass, ""};
      },
      nullptr
  );

  auto outcome = hook.run_and_transform();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(ran);
  EXPECT_EQ(outcome->status_, HookStatus::Fail);
  EXPECT_NE(outcome->output_.find("hkr-definitely-not-a-command"), std::string::npos);
  EXPECT_NE(outcome->output_.find("apt install hkr-tools"), std::string::npos);
}

TEST(ConfiguredHookTest, CheckErrorPropagates) {
  Check check = [](std::span<std::string const>) -> core::Result<HookOutcome> {
    return std::unexpected(core::Error{"broken"});
  };
  ConfiguredHook hook("Lint", HookSettings{}, check, nullptr);

  auto outcome = hook.run_and_transform();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().message(), "broken");
}

TEST(HookStatusTest, ParseAndPrint) {
  EXPECT_EQ(parse_status("warn"), HookStatus::Warn);
  EXPECT_EQ(parse_status("fail"), HookStatus::Fail);
  EXPECT_FALSE(parse_status("interrupt").has_value());
  EXPECT_FALSE(parse_status("FAIL").has_value());
  EXPECT_EQ(to_string(HookStatus::Interrupt), "interrupt");
}

} // namespace hkr::hook::test

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hkr/context/context.hpp"
#include "test_utils.hpp"

namespace hkr::context::test {

using hkr::test::CapturedOutput;
using hkr::test::make_logger;

class CommandContextTest : public ::testing::Test {
protected:
  CapturedOutput output_;
  core::Logger   logger_ = make_logger(output_);
};

TEST_F(CommandContextTest, EmptySettingsDoNothing) {
  CommandContext context("pre-commit", config::EnvironmentSettings{}, logger_);

  EXPECT_EQ(context.hook_type(), "pre-commit");
  EXPECT_TRUE(context.setup_environment().has_value());
  EXPECT_TRUE(context.cleanup_environment().has_value());

  auto files = context.modified_files();
  ASSERT_TRUE(files.has_value());
  EXPECT_TRUE((*files)->empty());
}

TEST_F(CommandContextTest, FailingStepIsAnError) {
  config::EnvironmentSettings settings;
  settings.setup_   = {"true"};
  settings.cleanup_ = {"sh", "-c", "echo cannot restore >&2; exit 3"};
  CommandContext context("pre-commit", settings, logger_);

  EXPECT_TRUE(context.setup_environment().has_value());

  auto cleanup = context.cleanup_environment();
  ASSERT_FALSE(cleanup.has_value());
  EXPECT_NE(cleanup.error().message().find("exited with 3"), std::string::npos);
  EXPECT_NE(cleanup.error().message().find("cannot restore"), std::string::npos);
}

TEST_F(CommandContextTest, MissingSetupCommandIsAnError) {
  config::EnvironmentSettings settings;
  settings.setup_ = {"hkr-definitely-not-a-command"};
  CommandContext context("pre-commit", settings, logger_);

  EXPECT_FALSE(context.setup_environment().has_value());
}

TEST_F(CommandContextTest, FilesAreSplitAndCached) {
  auto counter = hkr::test::write_temp_file("files-count", "");

  config::EnvironmentSettings settings;
  settings.files_ = {"sh", "-c", "echo x >> \"$0\"; printf 'a.cpp\\n\\nsrc/b c.cpp\\r\\n'", counter};
  CommandContext context("pre-commit", settings, logger_);

  auto first = context.modified_files();
  ASSERT_TRUE(first.has_value()) << first.error().describe();
  EXPECT_EQ(**first, (std::vector<std::string>{"a.cpp", "src/b c.cpp"}));

  auto second = context.modified_files();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->get(), second->get());

  // The files command ran once.
  std::ifstream in(counter);
  std::string   runs((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(runs, "x\n");
}

} // namespace hkr::context::test

#include <gtest/gtest.h>

#include <string>

#include "hkr/core/env.hpp"
#include "hkr/core/log.hpp"
#include "test_utils.hpp"

namespace hkr::core::test {

using hkr::test::CapturedOutput;

TEST(LoggerTest, PlainOutputWithoutColor) {
  CapturedOutput output;
  Logger         log(output.file(), false, false);

  log.partial("Checking");
  log.partial("...");
  log.success("OK");
  log.error("FAILED");

  EXPECT_EQ(output.str(), "Checking...OK\nFAILED\n");
}

TEST(LoggerTest, DebugOnlyWhenEnabled) {
  CapturedOutput output;
  Logger         log(output.file(), false, false);

  log.debug("hidden");
  EXPECT_EQ(output.str(), "");

  log.set_debug(true);
  log.debug("shown");
  EXPECT_EQ(output.str(), "[hkr] shown\n");
}

TEST(LoggerTest, ColorAddsEscapeSequences) {
  CapturedOutput output;
  Logger         log(output.file(), false, true);

  log.warning("careful");
  auto text = output.str();
  EXPECT_NE(text.find("\x1b["), std::string::npos);
  EXPECT_NE(text.find("careful"), std::string::npos);
}

TEST(LoggerTest, NoColorDisablesColorSupport) {
  env::set("NO_COLOR", "1");
  EXPECT_FALSE(color_supported(stdout));
  env::unset("NO_COLOR");
}

TEST(EnvTest, EnabledValues) {
  env::set("HKR_TEST_FLAG", "1");
  EXPECT_TRUE(env::enabled("HKR_TEST_FLAG"));
  env::set("HKR_TEST_FLAG", "false");
  EXPECT_FALSE(env::enabled("HKR_TEST_FLAG"));
  env::unset("HKR_TEST_FLAG");
  EXPECT_FALSE(env::enabled("HKR_TEST_FLAG"));
}

} // namespace hkr::core::test

#include <array>
#include <span>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hkr/cli/argument_parser.hpp"

namespace hkr::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  ArgumentParser parser_ = patterns::create_hkr_parser("hkr");

  auto parse(std::vector<std::string> args) -> ParseResult {
    return parser_.parse(std::span<std::string const>(args));
  }
};

TEST_F(ArgumentParserTest, FlagsAndPositionals) {
  auto result = parse({"-v", "run", "--quiet", "pre-commit"});

  ASSERT_FALSE(result.has_error());
  EXPECT_TRUE(result.has("verbose"));
  EXPECT_TRUE(result.has("quiet"));
  EXPECT_FALSE(result.has("help"));
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"run", "pre-commit"}));
}

TEST_F(ArgumentParserTest, ValueOption) {
  auto result = parse({"--config", "ci.json", "list", "pre-push"});

  ASSERT_FALSE(result.has_error());
  EXPECT_EQ(result.get("config"), "ci.json");

  auto short_form = parse({"-c", "other.json"});
  EXPECT_EQ(short_form.get("config"), "other.json");
}

TEST_F(ArgumentParserTest, MissingValue) {
  auto result = parse({"run", "--config"});
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error_message(), "Option --config requires a value");
}

TEST_F(ArgumentParserTest, UnknownOption) {
  auto result = parse({"--frobnicate"});
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error_message(), "Unknown option: --frobnicate");
}

TEST_F(ArgumentParserTest, DoubleDashEndsOptions) {
  auto result = parse({"run", "--", "-v"});
  ASSERT_FALSE(result.has_error());
  EXPECT_FALSE(result.has("verbose"));
  EXPECT_EQ(result.positional_args(), (std::vector<std::string>{"run", "-v"}));
}

TEST_F(ArgumentParserTest, DefaultValue) {
  ArgumentParser parser("tool");
  parser.add_option("l", "level", "Level", Option::Type::Value).default_value("2");

  std::vector<std::string> none;
  EXPECT_EQ(parser.parse(std::span<std::string const>(none)).get("level"), "2");

  std::vector<std::string> given{"-l", "5"};
  EXPECT_EQ(parser.parse(std::span<std::string const>(given)).get("level"), "5");
}

TEST_F(ArgumentParserTest, ArgcArgv) {
  std::array<char const*, 4> argv{"hkr", "--version", "run", "pre-commit"};
  auto result = parser_.parse(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));

  ASSERT_FALSE(result.has_error());
  EXPECT_TRUE(result.has("version"));
  EXPECT_EQ(result.positional_args().size(), 2u);
}

TEST_F(ArgumentParserTest, HelpListsOptions) {
  auto help = parser_.generate_help();

  EXPECT_NE(help.find("Usage: hkr [options] <run|list> <hook-type>"), std::string::npos);
  EXPECT_NE(help.find("-c, --config <val>"), std::string::npos);
  EXPECT_NE(help.find("--version"), std::string::npos);
}

} // namespace hkr::cli::test

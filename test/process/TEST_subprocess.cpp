#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "hkr/process/subprocess.hpp"

namespace hkr::process::test {

TEST(SubprocessTest, CapturesStreamsSeparately) {
  std::vector<std::string> argv{"sh", "-c", "printf out; printf err >&2; exit 3"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value()) << result.error().describe();
  EXPECT_EQ(result->exit_code(), 3);
  EXPECT_FALSE(result->success());
  EXPECT_EQ(result->standard_output(), "out");
  EXPECT_EQ(result->standard_error(), "err");
}

TEST(SubprocessTest, ArgumentsAreLiteral) {
  std::vector<std::string> argv{"printf", "%s|", "a b", "$HOME", "*"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->success());
  EXPECT_EQ(result->standard_output(), "a b|$HOME|*|");
}

TEST(SubprocessTest, LargeOutputIsComplete) {
  constexpr size_t         size = 4 * 1024 * 1024;
  std::vector<std::string> argv{"sh", "-c", "head -c 4194304 /dev/zero | tr '\\0' x"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->standard_output().size(), size);
  EXPECT_EQ(result->standard_output(), std::string(size, 'x'));
  EXPECT_TRUE(result->standard_error().empty());
}

TEST(SubprocessTest, OutputIsNotTrimmed) {
  std::vector<std::string> argv{"printf", "\n  padded  \n\n"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->standard_output(), "\n  padded  \n\n");
}

TEST(SubprocessTest, StdinIsEmpty) {
  std::vector<std::string> argv{"cat"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->success());
  EXPECT_TRUE(result->standard_output().empty());
}

TEST(SubprocessTest, SignalledChildReportsShellExitCode) {
  std::vector<std::string> argv{"sh", "-c", "kill -TERM $$"};
  auto                     result = spawn(argv);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code(), 128 + SIGTERM);
}

TEST(SubprocessTest, StoppedChildIsKilledAndReported) {
  std::vector<std::string> argv{"sh", "-c", "kill -STOP $$; echo resumed"};
  auto                     result = spawn(argv);

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("stopped waiting for terminal input"), std::string::npos);
}

TEST(SubprocessTest, MissingExecutableIsAnError) {
  std::vector<std::string> argv{"hkr-definitely-not-a-command"};
  auto                     result = spawn(argv);

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("hkr-definitely-not-a-command"), std::string::npos);
}

TEST(SubprocessTest, EmptyArgvIsAnError) {
  std::vector<std::string> argv;
  EXPECT_FALSE(spawn(argv).has_value());
  EXPECT_FALSE(spawn_detached(argv).has_value());
}

TEST(SubprocessTest, DetachedProcessCanBePolled) {
  std::vector<std::string> argv{"sh", "-c", "sleep 0.1; exit 4"};
  auto                     child = spawn_detached(argv);
  ASSERT_TRUE(child.has_value()) << child.error().describe();
  EXPECT_GT(child->pid(), 0);

  std::optional<int> code;
  for (int i = 0; i < 100 && !code; ++i) {
    auto polled = child->try_wait();
    ASSERT_TRUE(polled.has_value());
    code = *polled;
    if (!code) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 4);
}

TEST(SubprocessTest, DroppedDetachedHandleLeavesChildRunning) {
  auto marker = std::filesystem::path(::testing::TempDir()) / "hkr-detached-marker";
  std::filesystem::remove(marker);

  std::vector<std::string> argv{"sh", "-c", "sleep 0.2; : > \"$1\"", "sh", marker.string()};
  {
    auto child = spawn_detached(argv);
    ASSERT_TRUE(child.has_value()) << child.error().describe();
  }

  for (int i = 0; i < 100 && !std::filesystem::exists(marker); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  EXPECT_TRUE(std::filesystem::exists(marker));
}

TEST(SubprocessTest, FindExecutable) {
  auto sh = find_executable("sh");
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(sh->back(), 'h');

  EXPECT_FALSE(find_executable("hkr-definitely-not-a-command").has_value());
  EXPECT_FALSE(find_executable("").has_value());
  EXPECT_FALSE(find_executable("/nonexistent/sh").has_value());
}

TEST(SubprocessTest, ShellJoinQuotesWhenNeeded) {
  std::vector<std::string> argv{"git", "commit", "-m", "it's done", ""};
  EXPECT_EQ(shell_join(argv), "git commit -m 'it'\\''s done' ''");
}

TEST(SubprocessTest, ExitCodeFromStatus) {
  EXPECT_EQ(exit_code_from_status(0), 0);
  EXPECT_EQ(exit_code_from_status(2 << 8), 2);
  EXPECT_EQ(exit_code_from_status(SIGKILL), 128 + SIGKILL);
}

} // namespace hkr::process::test

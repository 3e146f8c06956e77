#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "hkr/core/interrupt.hpp"
#include "hkr/process/subprocess.hpp"

namespace hkr::core::interrupt::test {

namespace {

auto current_sigint_handler() -> void (*)(int) {
  struct sigaction current{};
  sigaction(SIGINT, nullptr, &current);
  return current.sa_handler;
}

} // namespace

class InterruptIsolationTest : public ::testing::Test {
protected:
  void SetUp() override {
    InterruptHandler::instance().clear();
    InterruptHandler::instance().clear_foreground_group();
  }

  void TearDown() override {
    InterruptHandler::instance().clear();
    InterruptHandler::instance().clear_foreground_group();
  }
};

TEST_F(InterruptIsolationTest, FullIsolationDiscardsSigint) {
  auto before = current_sigint_handler();
  {
    auto isolation = FullIsolation::acquire();
    ASSERT_TRUE(isolation.has_value());
    EXPECT_EQ(current_sigint_handler(), SIG_IGN);

    raise(SIGINT);
  }
  EXPECT_EQ(current_sigint_handler(), before);
  EXPECT_FALSE(InterruptHandler::instance().requested());
}

TEST_F(InterruptIsolationTest, DeferredIsolationRecordsSigint) {
  auto isolation = DeferredIsolation::acquire();
  ASSERT_TRUE(isolation.has_value());

  raise(SIGINT);
  EXPECT_TRUE(InterruptHandler::instance().requested());

  EXPECT_TRUE(isolation->release());
  EXPECT_FALSE(InterruptHandler::instance().requested());
  // Releasing twice reports nothing new.
  EXPECT_FALSE(isolation->release());
}

TEST_F(InterruptIsolationTest, DeferredIsolationWithoutSigint) {
  auto isolation = DeferredIsolation::acquire();
  ASSERT_TRUE(isolation.has_value());
  EXPECT_FALSE(isolation->release());
}

TEST_F(InterruptIsolationTest, DeferredInsideFullRestoresIgnore) {
  auto outer = FullIsolation::acquire();
  ASSERT_TRUE(outer.has_value());
  {
    auto inner = DeferredIsolation::acquire();
    ASSERT_TRUE(inner.has_value());
    EXPECT_NE(current_sigint_handler(), SIG_IGN);
  }
  EXPECT_EQ(current_sigint_handler(), SIG_IGN);

  // Back under full isolation, a late SIGINT is dropped.
  raise(SIGINT);
  EXPECT_FALSE(InterruptHandler::instance().requested());
}

TEST_F(InterruptIsolationTest, ForegroundGroupBookkeeping) {
  auto& handler = InterruptHandler::instance();
  handler.set_foreground_group(12345);
  EXPECT_EQ(handler.foreground_group(), 12345);

  handler.clear_foreground_group();
  EXPECT_EQ(handler.foreground_group(), 0);
}

TEST_F(InterruptIsolationTest, SigintIsForwardedToRunningChild) {
  auto isolation = DeferredIsolation::acquire();
  ASSERT_TRUE(isolation.has_value());

  std::thread sender([] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    kill(getpid(), SIGINT);
  });

  std::vector<std::string> argv{"sleep", "5"};
  auto                     result = process::spawn(argv);
  sender.join();

  ASSERT_TRUE(result.has_value()) << result.error().describe();
  EXPECT_EQ(result->exit_code(), 128 + SIGINT);
  EXPECT_TRUE(isolation->release());
}

TEST_F(InterruptIsolationTest, SigintEndsStoppedChild) {
  std::vector<std::string> argv{"sleep", "5"};
  auto                     child = process::spawn_detached(argv);
  ASSERT_TRUE(child.has_value()) << child.error().describe();
  ASSERT_EQ(kill(child->pid(), SIGSTOP), 0);

  auto isolation = DeferredIsolation::acquire();
  ASSERT_TRUE(isolation.has_value());
  InterruptHandler::instance().set_foreground_group(child->pid());
  raise(SIGINT);

  std::optional<int> code;
  for (int i = 0; i < 100 && !code; ++i) {
    auto polled = child->try_wait();
    ASSERT_TRUE(polled.has_value());
    code = *polled;
    if (!code) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 128 + SIGINT);
  EXPECT_TRUE(isolation->release());
}

TEST_F(InterruptIsolationTest, PendingInterruptRefusesNewChildren) {
  auto isolation = DeferredIsolation::acquire();
  ASSERT_TRUE(isolation.has_value());
  raise(SIGINT);

  std::vector<std::string> argv{"true"};
  auto                     result = process::spawn(argv);
  EXPECT_FALSE(result.has_value());

  EXPECT_TRUE(isolation->release());

  // Once released, commands run again.
  auto after = process::spawn(argv);
  ASSERT_TRUE(after.has_value());
  EXPECT_TRUE(after->success());
}

} // namespace hkr::core::interrupt::test

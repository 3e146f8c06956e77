#pragma once

#include <atomic>
#include <csignal>

#include <sys/types.h>

#include "hkr/core/error.hpp"

namespace hkr::core::interrupt {

// SIGINT state shared between the orchestrator and the signal handler that
// DeferredIsolation installs.
class InterruptHandler {
  static inline std::atomic<bool>  requested_{false};
  static inline std::atomic<pid_t> foreground_group_{0};

  static void handle_sigint(int sig);

  InterruptHandler()  = default;
  ~InterruptHandler() = default;

  friend class DeferredIsolation;

public:
  InterruptHandler(InterruptHandler const&)            = delete;
  InterruptHandler& operator=(InterruptHandler const&) = delete;
  InterruptHandler(InterruptHandler&&)                 = delete;
  InterruptHandler& operator=(InterruptHandler&&)      = delete;

  [[nodiscard]] auto requested() const noexcept -> bool;
  auto               consume() noexcept -> bool;
  void               clear() noexcept;

  // The process group that receives a forwarded SIGINT while one is running.
  void               set_foreground_group(pid_t group) noexcept;
  void               clear_foreground_group() noexcept;
  [[nodiscard]] auto foreground_group() const noexcept -> pid_t;

  static InterruptHandler& instance() {
    static InterruptHandler instance;
    return instance;
  }
};

// Mode A: SIGINT is ignored for the lifetime of the object. Signals arriving
// meanwhile are discarded, not delivered later.
class FullIsolation {
  struct sigaction previous_{};
  bool             active_ = false;

  FullIsolation() = default;

public:
  [[nodiscard]] static auto acquire() -> Result<FullIsolation>;

  ~FullIsolation();

  FullIsolation(FullIsolation const&)            = delete;
  FullIsolation& operator=(FullIsolation const&) = delete;
  FullIsolation(FullIsolation&& other) noexcept;
  FullIsolation& operator=(FullIsolation&&) = delete;
};

// Mode B: SIGINT is caught while the object is active. The handler records the
// request and forwards the signal to the foreground process group, so only the
// running child is cancelled. release() puts the previous disposition back.
class DeferredIsolation {
  struct sigaction previous_{};
  bool             active_ = false;

  DeferredIsolation() = default;

public:
  [[nodiscard]] static auto acquire() -> Result<DeferredIsolation>;

  ~DeferredIsolation();

  DeferredIsolation(DeferredIsolation const&)            = delete;
  DeferredIsolation& operator=(DeferredIsolation const&) = delete;
  DeferredIsolation(DeferredIsolation&& other) noexcept;
  DeferredIsolation& operator=(DeferredIsolation&&) = delete;

  // Returns whether SIGINT arrived while active, and resets the request.
  auto release() noexcept -> bool;
};

} // namespace hkr::core::interrupt

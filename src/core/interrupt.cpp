#include "hkr/core/interrupt.hpp"

#include <cerrno>
#include <csignal>
#include <expected>

#include <pthread.h>
#include <unistd.h>

namespace hkr::core::interrupt {

namespace {

// Keeps SIGINT pending while a disposition is swapped, so the handler never
// observes a half-updated state.
class SigintBlock {
  sigset_t previous_{};

public:
  SigintBlock() noexcept {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    pthread_sigmask(SIG_BLOCK, &set, &previous_);
  }

  ~SigintBlock() {
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  SigintBlock(SigintBlock const&)            = delete;
  SigintBlock& operator=(SigintBlock const&) = delete;
};

} // namespace

void InterruptHandler::handle_sigint(int) {
  int saved_errno = errno;

  requested_.store(true);

  pid_t group = foreground_group_.load();
  if (group > 0 && group != getpgrp()) {
    kill(-group, SIGINT);
    // A stopped group only acts on SIGINT once it runs again.
    kill(-group, SIGCONT);
  }

  errno = saved_errno;
}

auto InterruptHandler::requested() const noexcept -> bool {
  return requested_.load();
}

auto InterruptHandler::consume() noexcept -> bool {
  return requested_.exchange(false);
}

void InterruptHandler::clear() noexcept {
  requested_ = false;
}

void InterruptHandler::set_foreground_group(pid_t group) noexcept {
  foreground_group_ = group;
}

void InterruptHandler::clear_foreground_group() noexcept {
  foreground_group_ = 0;
}

auto InterruptHandler::foreground_group() const noexcept -> pid_t {
  return foreground_group_.load();
}

auto FullIsolation::acquire() -> Result<FullIsolation> {
  FullIsolation isolation;

  struct sigaction sa = {};
  sa.sa_handler       = SIG_IGN;
  sigemptyset(&sa.sa_mask);

  if (sigaction(SIGINT, &sa, &isolation.previous_) == -1) {
    return std::unexpected(Error::from_errno("cannot ignore SIGINT", errno));
  }

  isolation.active_ = true;
  return isolation;
}

FullIsolation::~FullIsolation() {
  if (active_) {
    sigaction(SIGINT, &previous_, nullptr);
  }
}

FullIsolation::FullIsolation(FullIsolation&& other) noexcept
    : previous_(other.previous_), active_(other.active_) {
  other.active_ = false;
}

auto DeferredIsolation::acquire() -> Result<DeferredIsolation> {
  DeferredIsolation isolation;
  SigintBlock       block;

  InterruptHandler::instance().clear();

  // No SA_RESTART: a blocking wait should see EINTR and re-check its child.
  struct sigaction sa = {};
  sa.sa_handler       = InterruptHandler::handle_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  if (sigaction(SIGINT, &sa, &isolation.previous_) == -1) {
    return std::unexpected(Error::from_errno("cannot install SIGINT handler", errno));
  }

  isolation.active_ = true;
  return isolation;
}

DeferredIsolation::~DeferredIsolation() {
  [[maybe_unused]] auto _ = release();
}

DeferredIsolation::DeferredIsolation(DeferredIsolation&& other) noexcept
    : previous_(other.previous_), active_(other.active_) {
  other.active_ = false;
}

auto DeferredIsolation::release() noexcept -> bool {
  if (!active_) {
    return false;
  }

  SigintBlock block;
  sigaction(SIGINT, &previous_, nullptr);
  active_ = false;

  auto& handler = InterruptHandler::instance();
  handler.clear_foreground_group();
  return handler.consume();
}

} // namespace hkr::core::interrupt

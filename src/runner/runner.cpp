#include "hkr/runner/runner.hpp"

#include <algorithm>
#include <exception>
#include <expected>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "hkr/core/interrupt.hpp"

namespace hkr::runner {

using core::Error;
using hook::HookOutcome;
using hook::HookStatus;

namespace {

auto fault_outcome(Error const& error) -> HookOutcome {
  return HookOutcome{HookStatus::Fail, fmt::format("{}\n{}", HOOK_FAULT_HEADER, error.describe())};
}

} // namespace

auto to_string(RunErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
    case RunErrorKind::Load:
      return "load";
    case RunErrorKind::Setup:
      return "setup";
    case RunErrorKind::Cleanup:
      return "cleanup";
    case RunErrorKind::Isolation:
      return "isolation";
  }
  return "unknown";
}

HookRunner::HookRunner(hook::Loader& loader, context::Context& context, ResultSink& sink, core::Logger& logger)
    : loader_(loader), context_(context), sink_(sink), logger_(logger) {}

auto HookRunner::run() -> core::Result<bool, RunError> {
  // Setup and cleanup are expected to finish quickly, so they are not
  // interruptible at all.
  auto isolation = core::interrupt::FullIsolation::acquire();
  if (!isolation) {
    return std::unexpected(RunError{RunErrorKind::Isolation, std::move(isolation.error())});
  }

  // Load before touching the repository, so a load error leaves it as it was.
  auto hooks = loader_.load_hooks();
  if (!hooks) {
    return std::unexpected(RunError{RunErrorKind::Load, std::move(hooks.error())});
  }
  hooks_ = std::move(*hooks);

  // A setup that did not complete gives no guarantee cleanup can undo it, so
  // cleanup is skipped.
  if (auto setup = context_.setup_environment(); !setup) {
    return std::unexpected(RunError{RunErrorKind::Setup, std::move(setup.error())});
  }

  bool passed = false;
  try {
    passed = run_hooks();
  } catch (...) {
    if (auto cleanup = context_.cleanup_environment(); !cleanup) {
      logger_.error(cleanup.error().describe());
    }
    throw;
  }

  if (auto cleanup = context_.cleanup_environment(); !cleanup) {
    return std::unexpected(RunError{RunErrorKind::Cleanup, std::move(cleanup.error())});
  }
  return passed;
}

auto HookRunner::run_hooks() -> bool {
  if (std::ranges::none_of(hooks_, [](auto const& hook) { return hook->enabled(); })) {
    sink_.nothing_to_run();
    return true;
  }

  sink_.start_run();

  bool interrupted = false;
  bool failed      = false;
  bool warned      = false;

  for (auto& hook : hooks_) {
    auto status = run_hook(*hook);
    if (!status) {
      continue;
    }

    failed = failed || *status == HookStatus::Fail;
    warned = warned || *status == HookStatus::Warn;

    if (*status == HookStatus::Interrupt) {
      interrupted = true;
      break;
    }
  }

  if (interrupted) {
    sink_.run_interrupted();
  } else if (failed) {
    sink_.run_failed();
  } else if (warned) {
    sink_.run_warned();
  } else {
    sink_.run_succeeded();
  }

  return !(failed || interrupted);
}

auto HookRunner::should_skip(hook::Hook const& hook) -> bool {
  if (!hook.enabled()) {
    return true;
  }

  if (hook.skip_requested()) {
    if (hook.required()) {
      sink_.required_hook_not_skipped(hook);
    } else {
      // Only worth mentioning if the hook would have run.
      if (hook.would_run()) {
        sink_.hook_skipped(hook);
      }
      return true;
    }
  }

  return !hook.would_run();
}

auto HookRunner::run_hook(hook::Hook& hook) -> std::optional<HookStatus> {
  if (should_skip(hook)) {
    return std::nullopt;
  }

  sink_.start_hook(hook);

  HookOutcome outcome{HookStatus::Pass, ""};
  bool        interrupted = false;

  auto frame = fmt::format("in hook {}", hook.name());
  {
    // SIGINT stops the hook's current child instead of the whole run.
    auto isolation = core::interrupt::DeferredIsolation::acquire();
    if (!isolation) {
      outcome = fault_outcome(std::move(isolation.error()).context(frame));
    } else {
      try {
        auto result = hook.run_and_transform();
        if (result) {
          outcome = std::move(*result);
        } else {
          outcome = fault_outcome(std::move(result.error()).context(frame));
        }
      } catch (std::exception const& e) {
        outcome = fault_outcome(Error{e.what()}.context(frame));
      } catch (...) {
        outcome = fault_outcome(Error{"unknown exception"}.context(frame));
      }
      interrupted = isolation->release();
    }
  }

  if (interrupted) {
    outcome = HookOutcome{HookStatus::Interrupt, std::string{HOOK_INTERRUPTED}};
  }

  logger_.debug(fmt::format("{} finished with {}", hook.name(), hook::to_string(outcome.status_)));
  sink_.end_hook(hook, outcome.status_, outcome.output_);
  return outcome.status_;
}

} // namespace hkr::runner
